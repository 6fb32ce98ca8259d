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

#include <algorithm>  // for find_if
#include <string>
#include <vector>
#include <regex>
#include <cctype>

#include "nrdefines.h"

extern std::regex digits_regex;
extern std::regex node_prefix_regex;
extern std::regex node_name_regex;  // two submatches, the prefix and the digits of the numeric suffix

std::vector<std::string> tokenize(const std::string& s, const std::string& separators = NR_DEFAULT_SEPARATORS);
    // Splits s at any run of separator characters.  Leading/trailing separators and
    // consecutive separators never produce empty tokens.

static inline std::string &ltrim(std::string &s){s.erase(s.begin(),std::find_if(s.begin(),s.end(),[](char c){return !isspace((unsigned char) c);}));return s;}
static inline std::string &rtrim(std::string &s){s.erase(std::find_if(s.rbegin(),s.rend(),[](char c){return !isspace((unsigned char) c);}).base(),s.end());return s;}
static inline std::string &trim (std::string &s){return ltrim(rtrim(s));}

bool stringCaseInsensitiveEquality(std::string s1, std::string s2);
std::string remove_underscores(std::string);

std::string render_string_harmless(const std::string s);
std::string quote_wrap(const std::string s);

std::string basename_of(const std::string& path);  // "/usr/local/bin/n2r" -> "n2r"
