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
#include <string>
#include <regex>
#include <utility>

#include "nrhelpers.h"
#include "noderange_error.h"
#include "node_spec.h"
#include "node_token.h"

void describe_node_range_syntax(std::ostream& o)
{
    o   << std::endl
        << "A node name is a prefix followed by a numeric suffix, as in \"node07\" or \"cn-0012\"." << std::endl
        << "The prefix is one or more letters or underscores, optionally followed by one hyphen or underscore." << std::endl
        << std::endl
        << "The number of digits in the suffix, counting leading zeros, is part of the name," << std::endl
        << "so \"node9\" and \"node09\" are two different nodes." << std::endl
        << std::endl
        << "There is a shorthand for writing a series of nodes whose names only differ in a consecutive" << std::endl
        << "numeric suffix.  Instead of saying" << std::endl
        << R"(   node04,node05,node06,node07)" << std::endl
        << "you can say" << std::endl
        << R"(   node[04-07])" << std::endl
        << "The first and last numbers in a range must have the same number of digits, so node[4-07] is an error." << std::endl
        << std::endl
        << "Node names and node ranges may be separated by commas, spaces, or both, as in" << std::endl
        << R"(   node[00-06],node08 node[10-23])" << std::endl
    ;
}

std::unique_ptr<node_spec> parse_node_spec(const std::string& token)
{
    node_token_parts parts;
    nr_::node_token_parser parser(parts);

    YY_BUFFER_STATE nr_buffer = nr__scan_string(token.c_str());  // it's two underscores, the first is part of the nr_ prefix

    int rc = parser.parse();

    nr__delete_buffer(nr_buffer);

    if (0 != rc)
    {
        bool looks_like_range = (std::string::npos != token.find_first_of("[]"));

        std::ostringstream o;
        o << "invalid " << (looks_like_range ? "node range" : "node name") << " \"" << token << "\"";
        if (parts.error_column > 0) o << " at character " << parts.error_column;
        o << " - " << parts.error_message << ".";

        throw noderange_error(looks_like_range ? nr_error_kind::InvalidRangeSyntax : nr_error_kind::InvalidNodeSyntax, token, o.str(), parts.error_column);
    }

    if (parts.is_range)
    {
        return std::unique_ptr<node_spec>(new node_range(token, parts.prefix, parts.first_digits, parts.last_digits));
    }

    return std::unique_ptr<node_spec>(new individual_node(token, Node(parts.prefix, parts.first_digits)));
}

node_range::node_range(const std::string& s, const std::string& p, const std::string& f, const std::string& l)
    : node_spec(s), prefix(p), first_digits(f), last_digits(l)
{
    if (first_digits.length() != last_digits.length())
    {
        std::ostringstream o;
        o << "invalid node range \"" << source << "\" - the first number \"" << first_digits << "\" has " << first_digits.length()
          << " digit" << (first_digits.length() == 1 ? "" : "s") << " and the last number \"" << last_digits << "\" has " << last_digits.length()
          << ".  Both must have the same number of digits.";
        throw noderange_error(nr_error_kind::MismatchedRangeWidth, source, o.str());
    }

    if (first_digits.length() > NR_MAX_SUFFIX_WIDTH)
    {
        std::ostringstream o;
        o << "invalid node range \"" << source << "\" - the numbers in a range may have at most " << NR_MAX_SUFFIX_WIDTH << " digits.";
        throw noderange_error(nr_error_kind::InvalidRangeSyntax, source, o.str());
    }

    Node first_node(prefix, first_digits);
    Node last_node (prefix, last_digits);

    first = first_node.get_value();
    last  = last_node.get_value();

    if (first > last)
    {
        std::swap(first, last);
        std::swap(first_digits, last_digits);
    }
}

void node_range::add_to_node_list(NodeSequence& nodes) const
{
    for (uint64_t i = first; i <= last; i++)
    {
        nodes.push_back(Node(prefix, i, width()));
    }

    return;
}

bool node_range::contains(const Node& n) const
{
    return n.get_prefix()   == prefix
        && n.suffix_width() == width()
        && n.get_value()    >= first
        && n.get_value()    <= last;
}
