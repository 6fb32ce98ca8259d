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

#include "node_token.parser.hh"

// What the node_token grammar recognized in one token.

struct node_token_parts
{
    bool is_range {false};
    std::string prefix {};
    std::string first_digits {};
    std::string last_digits {};  // same as first_digits for an individual node

    unsigned int error_column {0};
    std::string error_message {};

    nr_::location loc {};        // where the scanner is in the token
    bool scan_started {false};   // the scanner returns to its initial start condition on the first call
};

// The flex scanner generated from node_token.l, with prefix nr_.

#define YY_DECL nr_::node_token_parser::symbol_type nr_lex(node_token_parts& parts)
YY_DECL;

typedef struct yy_buffer_state *YY_BUFFER_STATE;

extern YY_BUFFER_STATE nr__scan_string ( const char *yy_str  );
void nr__delete_buffer ( YY_BUFFER_STATE b  );
