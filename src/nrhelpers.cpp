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
// nrhelpers.cpp


#include <cctype>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <regex>

#include "nrhelpers.h"


std::regex digits_regex(      "[[:digit:]]+");
std::regex node_prefix_regex( "[A-Za-z_]+[-_]?");
std::regex node_name_regex(   "([A-Za-z_]+[-_]?)([[:digit:]]+)");

std::vector<std::string> tokenize(const std::string& s, const std::string& separators)
{
    std::vector<std::string> tokens;

    std::string::size_type cursor {0};

    while (cursor < s.length())
    {
        cursor = s.find_first_not_of(separators, cursor);

        if (std::string::npos == cursor) break;

        std::string::size_type end_of_token = s.find_first_of(separators, cursor);

        if (std::string::npos == end_of_token)
        {
            tokens.push_back(s.substr(cursor));
            break;
        }

        tokens.push_back(s.substr(cursor, end_of_token - cursor));

        cursor = end_of_token;
    }

    return tokens;
}

bool stringCaseInsensitiveEquality(std::string s1, std::string s2) {
        if (s1.length()!=s2.length()) return false;
        if (s1.length()==0) return true;
        for (unsigned int i=0; i<s1.length(); i++) if (toupper((unsigned char) s1[i]) != toupper((unsigned char) s2[i])) return false;
        return true;
}

std::string remove_underscores(std::string s)
{	std::string r;
	for (unsigned int i=0; i < s.length(); i++)
	{
        auto c = s[i];

        if ('_' != c) r.push_back(c);
    }
	return r;
}

std::string render_string_harmless(const std::string s)
{
    std::ostringstream o;
    for (unsigned int i=0; i<s.size(); i++)
    {
        auto c = s[i];
        switch (c)
        {
            case '\"': o << "\\\""; break;
            case '\t': o << "\\t";  break;
            case '\r': o << "\\r";  break;
            case '\n': o << "\\n";  break;
            case '\\': o << "\\\\"; break;
            case '\b': o << "\\b";  break;
            default:
                if (isprint((unsigned char) c))
                {
                    o << c;
                }
                else
                {
                    o << "\\u" << std::hex << std::setw(4) << std::setfill('0') << (unsigned int) (unsigned char) c << std::dec;
                }
        }
    }
    return o.str();
}

std::string quote_wrap(const std::string s)
{
    std::ostringstream o;
    o << '\"' << render_string_harmless(s) << '\"';
    return o.str();
}

std::string basename_of(const std::string& path)
{
    auto last_slash = path.find_last_of('/');

    if (std::string::npos == last_slash) return path;

    return path.substr(last_slash+1);
}
