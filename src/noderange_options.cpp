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
#include <iostream>
#include <sstream>

#include "nrhelpers.h"
#include "noderange_options.h"

std::string nr_mode_to_string(nr_mode m)
{
    switch (m)
    {
        case nr_mode::unspecified: return "unspecified";
        case nr_mode::n2r:         return "n2r";
        case nr_mode::r2n:         return "r2n";
        case nr_mode::member:      return "member";
    }
    return "<unknown nr_mode>";
}

nr_mode mode_from_word(const std::string& s)
{
    if (stringCaseInsensitiveEquality(s, "n2r"))    return nr_mode::n2r;
    if (stringCaseInsensitiveEquality(s, "r2n"))    return nr_mode::r2n;
    if (stringCaseInsensitiveEquality(s, "member")) return nr_mode::member;
    return nr_mode::unspecified;
}

static bool is_option(const std::string& item, const std::string& option)
{
    return stringCaseInsensitiveEquality(remove_underscores(item), remove_underscores(option));
}

std::string usage_message(const std::string& executable_name)
{
    std::ostringstream o;
    o << std::endl << "Usage: " << executable_name << " [options] n2r|r2n|member <node names and node ranges>" << std::endl
        << "   or: n2r [options] <node names and node ranges>" << std::endl
        << "   or: r2n [options] <node names and node ranges>" << std::endl << std::endl
        << "n2r prints the nodes condensed into node range notation, e.g. \"node[00-06],node08,node[10-23]\"." << std::endl
        << "r2n prints the nodes one by one, in the order given, with node ranges expanded." << std::endl
        << "member <node> prints \"true\" and exits with 0 if the node is one of the nodes given, otherwise prints \"false\" and exits with 1." << std::endl << std::endl
        << "where \"[options]\" means zero or more of:" << std::endl << std::endl
        << "-log <file>" << std::endl
        << "     Turns on logging of routine events, appending to <file>." << std::endl << std::endl
        << "-json" << std::endl
        << "     Print the compiled node list as a JSON object.  Not with -unique, -separator, or a membership test." << std::endl << std::endl
        << "-unique" << std::endl
        << "     r2n sorts the nodes and removes duplicates before printing." << std::endl << std::endl
        << "-separator <string>" << std::endl
        << "     r2n prints <string> between nodes instead of a space." << std::endl << std::endl
        << "-in <node>" << std::endl
        << "     Same as \"member <node>\".  Can't be combined with \"n2r\" or \"r2n\" given as a mode word." << std::endl << std::endl
        << "-help or -h" << std::endl
        << "     Print this message." << std::endl << std::endl
        << "Examples:" << std::endl
        << "\t" << "n2r node00 node02,node01 node03" << std::endl
        << "\t" << "r2n -unique \"node[00-06],node08\"" << std::endl
        << "\t" << executable_name << " member node-02 \"node-[00-01],node-04\"" << std::endl
        ;
    return o.str();
}

std::pair<bool,std::string> noderange_options::parse(int argc, const char* const argv[])
{
    if (argc >= 1) executable_name = argv[0];

    mode = mode_from_word(basename_of(executable_name));

    bool mode_from_executable_name = (nr_mode::unspecified != mode);
    bool mode_word_seen {false};
    bool in_given {false};

    for (int arg_index = 1 /*skipping executable name*/ ; arg_index < argc ; arg_index++ )
    {{  // double braces to be really sure "item" is fresh every time.
        std::string item {argv[arg_index]};

        if (is_option(item, "-help") || is_option(item, "-h")) { help = true; continue; }
        if (is_option(item, "-json"))                          { json = true; continue; }
        if (is_option(item, "-unique"))                        { unique = true; continue; }

        if (is_option(item, "-log") || is_option(item, "-separator") || is_option(item, "-in"))
        {
            if (arg_index == (argc-1))
            {
                return std::make_pair(false, std::string("option \"") + item + std::string("\" must be followed by a value."));
            }

            std::string value {argv[++arg_index]};

            if (is_option(item, "-log"))
            {
                trim(value);
                if (0 == value.length()) return std::make_pair(false, std::string("-log must be followed by a non-empty file name."));
                routine_logging = true;
                logfilename = value;
            }
            else if (is_option(item, "-separator"))
            {
                separator = value;
            }
            else
            {
                member_node = trim(value);
                if (0 == member_node.length()) return std::make_pair(false, std::string("-in must be followed by a node name."));
                in_given = true;
            }
            continue;
        }

        if (item.length() > 0 && '-' == item[0])
        {
            return std::make_pair(false, std::string("unknown option \"") + item + std::string("\"."));
        }

        if ( (!mode_from_executable_name) && (!mode_word_seen) && node_arguments.empty() )
        {
            // the first word after the options is the mode word, unless -in already chose membership
            nr_mode m = mode_from_word(item);

            if (nr_mode::unspecified != m)
            {
                mode = m;
                mode_word_seen = true;
                continue;
            }

            if (!in_given)
            {
                return std::make_pair(false, std::string("expecting \"n2r\", \"r2n\", or \"member\" but found \"") + item + std::string("\"."));
            }
        }

        node_arguments.push_back(item);
    }}

    if (help) return std::make_pair(true, std::string(""));

    if (in_given)
    {
        if (mode_word_seen && nr_mode::member != mode)
        {
            return std::make_pair(false, std::string("-in <node> is a membership test and can't be combined with \"") + nr_mode_to_string(mode) + std::string("\"."));
        }
        mode = nr_mode::member;
    }

    if (nr_mode::unspecified == mode)
    {
        return std::make_pair(false, std::string("no mode given - say \"n2r\", \"r2n\", or \"member\"."));
    }

    if (json && nr_mode::member == mode)
    {
        return std::make_pair(false, std::string("-json prints a compiled node list and can't be combined with a membership test."));
    }

    if (json && (unique || separator != " "))
    {
        return std::make_pair(false, std::string("-json always lists the nodes as given, so -unique and -separator can't be combined with -json."));
    }

    if (nr_mode::member == mode && 0 == member_node.length())
    {
        if (node_arguments.empty())
        {
            return std::make_pair(false, std::string("member must be followed by the node name to look for."));
        }
        member_node = node_arguments.front();
        node_arguments.erase(node_arguments.begin());
    }

    return std::make_pair(true, std::string(""));
}
