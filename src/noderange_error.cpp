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
#include <string>

#include "noderange_error.h"

std::string nr_error_kind_to_string(nr_error_kind k)
{
    switch (k)
    {
        case nr_error_kind::InvalidNodeSyntax:    return "InvalidNodeSyntax";
        case nr_error_kind::InvalidRangeSyntax:   return "InvalidRangeSyntax";
        case nr_error_kind::MismatchedRangeWidth: return "MismatchedRangeWidth";
        case nr_error_kind::EmptyInput:           return "EmptyInput";
        case nr_error_kind::TooManyNodes:         return "TooManyNodes";
    }
    return "<unknown nr_error_kind>";
}
