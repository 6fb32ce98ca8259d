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
#include <stdexcept>

enum class nr_error_kind { InvalidNodeSyntax, InvalidRangeSyntax, MismatchedRangeWidth, EmptyInput, TooManyNodes };

std::string nr_error_kind_to_string(nr_error_kind);

class noderange_error : public std::runtime_error
{
public:
// variables
    nr_error_kind kind;
    std::string token {};       // the offending token, empty for EmptyInput
    unsigned int column {0};    // 1-based position in token where the grammar gave up, 0 if not applicable

// methods
    noderange_error(nr_error_kind k, const std::string& t, const std::string& message, unsigned int c = 0)
        : std::runtime_error(message), kind(k), token(t), column(c) {};
};
