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
#include <iomanip>
#include <regex>

#include "nrhelpers.h"
#include "noderange_error.h"
#include "Node.h"

std::ostream& operator<< (std::ostream& o, const Ordering& ord)
{
    switch (ord)
    {
        case Ordering::Less:    o << "Less";    break;
        case Ordering::Equal:   o << "Equal";   break;
        case Ordering::Greater: o << "Greater"; break;
    }
    return o;
}

Node::Node(const std::string& p, const std::string& digits) : prefix(p), suffix_digits(digits)
{
    if (!std::regex_match(prefix, node_prefix_regex))
    {
        std::ostringstream o;
        o << "invalid node name \"" << p << digits << "\" - the prefix \"" << p << "\" must be one or more letters or underscores, optionally followed by one hyphen or underscore.";
        throw noderange_error(nr_error_kind::InvalidNodeSyntax, p + digits, o.str());
    }

    if (!std::regex_match(suffix_digits, digits_regex))
    {
        std::ostringstream o;
        o << "invalid node name \"" << p << digits << "\" - the name must end in one or more digits.";
        throw noderange_error(nr_error_kind::InvalidNodeSyntax, p + digits, o.str());
    }

    if (suffix_digits.length() > NR_MAX_SUFFIX_WIDTH)
    {
        std::ostringstream o;
        o << "invalid node name \"" << p << digits << "\" - the numeric suffix may have at most " << NR_MAX_SUFFIX_WIDTH << " digits.";
        throw noderange_error(nr_error_kind::InvalidNodeSyntax, p + digits, o.str());
    }

    for (auto c : suffix_digits) { value = (10 * value) + (c - '0'); }
}

Node::Node(const std::string& p, uint64_t v, unsigned int width) : Node(p, zero_padded(v, width))
{
    if (suffix_width() != width)
    {
        std::ostringstream o;
        o << "value " << v << " does not fit in a " << width << " digit suffix for node prefix \"" << p << "\".";
        throw noderange_error(nr_error_kind::InvalidNodeSyntax, name(), o.str());
    }
}

Node Node::parse(const std::string& name)
{
    std::smatch entire_match;

    if (!std::regex_match(name, entire_match, node_name_regex))
    {
        std::ostringstream o;
        o << "invalid node name \"" << name << "\" - a node name is one or more letters or underscores, optionally followed by one hyphen or underscore, followed by one or more digits, as in \"node07\" or \"cn-0012\".";
        throw noderange_error(nr_error_kind::InvalidNodeSyntax, name, o.str());
    }

    std::ssub_match prefix_match = entire_match[1];
    std::ssub_match suffix_match = entire_match[2];

    return Node(prefix_match.str(), suffix_match.str());
}

std::string zero_padded(uint64_t value, unsigned int width)
{
    std::ostringstream o;
    o << std::setw(width) << std::setfill('0') << value;
    return o.str();
}

Ordering compare(const Node& a, const Node& b)
{
    int c = a.get_prefix().compare(b.get_prefix());

    if (c < 0) return Ordering::Less;
    if (c > 0) return Ordering::Greater;

    if (a.suffix_width() < b.suffix_width()) return Ordering::Less;
    if (a.suffix_width() > b.suffix_width()) return Ordering::Greater;

    if (a.get_value() < b.get_value()) return Ordering::Less;
    if (a.get_value() > b.get_value()) return Ordering::Greater;

    return Ordering::Equal;
}

bool is_successor(const Node& a, const Node& b)
{
    if (a.get_prefix() != b.get_prefix()) return false;

    if (a.suffix_width() != b.suffix_width()) return false;

    // "99" + 1 formats as "100", which no longer fits in a width of 2.
    if (zero_padded(a.get_value() + 1, a.suffix_width()).length() != a.suffix_width()) return false;

    return (a.get_value() + 1) == b.get_value();
}

std::ostream& operator<< (std::ostream& o, const Node& n)
{
    o << n.name();
    return o;
}
