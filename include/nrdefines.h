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

#define NR_MAX_SUFFIX_WIDTH 18
    // Numeric suffixes are held in a uint64_t.  18 decimal digits always fit,
    // and so does the value one higher, which is what the successor test computes.

#define NR_MAX_EXPANDED_NODES 10000000
    // Upper limit on how many nodes one call may expand to.

#define NR_DEFAULT_SEPARATORS " \t\r\n,"
    // Node arguments may separate node names and node ranges with commas, whitespace, or both.

const std::string noderange_version {"1.00.00"};
