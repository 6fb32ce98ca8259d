//Copyright (c) 2016, 2017, 2018 Hitachi Vantara Corporation
//All Rights Reserved.
//
//   Licensed under the Apache License, Version 2.0 (the "License"); you may
//   not use this file except in compliance with the License. You may obtain
//   a copy of the License at
//
//         http://www.apache.org/licenses/LICENSE-2.0
//
//   Unless required by applicable law or agreed to in writing, software
//   distributed under the License is distributed on an "AS IS" BASIS, WITHOUT
//   WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the
//   License for the specific language governing permissions and limitations
//   under the License.
//
//Authors: Allart Ian Vogelesang <ian.vogelesang@hitachivantara.com>
//
//Support:  "noderange" is not officially supported by Hitachi Vantara.
//          Contact one of the authors by email and as time permits, we'll help on a best efforts basis.
#pragma once

#include <string>
#include <vector>
#include <utility>

enum class nr_mode { unspecified, n2r, r2n, member };

std::string nr_mode_to_string(nr_mode);

nr_mode mode_from_word(const std::string&);  // "n2r", "r2n", or "member", otherwise nr_mode::unspecified

struct noderange_options
{
// variables
    std::string executable_name {"noderange"};
    nr_mode mode {nr_mode::unspecified};
    bool routine_logging {false};
    std::string logfilename {"<none>"};
    bool json {false};
    bool unique {false};
    bool help {false};
    std::string separator {" "};
    std::string member_node {};
    std::vector<std::string> node_arguments {};

// methods
    std::pair<bool,std::string> parse(int argc, const char* const argv[]);
        // Invoked as "n2r" or "r2n" (for example through a symbolic link), the mode comes from the executable name.
        // Otherwise the first argument that isn't an option must be "n2r", "r2n", or "member".
        // Options are matched ignoring case and underscores, so -LOG and -lo_g are the same.
        // Returns false with an error message on bad arguments.
};

std::string usage_message(const std::string& executable_name);
