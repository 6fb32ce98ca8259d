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

#include <list>
#include <memory>
#include <string>
#include <iostream>

#include "Node.h"
#include "node_sequence.h"

class node_spec
{
public:
    std::string source {};  // the token as written

    node_spec(const std::string& s) : source(s) {};

    virtual void add_to_node_list(NodeSequence&) const = 0;
    virtual bool contains(const Node&) const = 0;
    virtual uint64_t node_count() const = 0;
    virtual bool is_range() const = 0;
    virtual void display(const std::string&, std::ostream&) const = 0;
    virtual ~node_spec(){};
};

std::unique_ptr<node_spec> parse_node_spec(const std::string& token);
    // Parses one token, either a node name "cn07" or a node range "cn[00-15]".
    // Throws noderange_error - InvalidRangeSyntax if the token has '[' or ']' in it
    // but isn't a well formed range, InvalidNodeSyntax for anything else that doesn't parse,
    // and MismatchedRangeWidth if the first and last numbers in a range have different numbers of digits.

void describe_node_range_syntax(std::ostream&);


class individual_node : public node_spec
{
    // "sun159"

public:
    Node node;

    individual_node(const std::string& s, const Node& n) : node_spec(s), node(n) {};

    virtual void add_to_node_list(NodeSequence& nodes) const override {nodes.push_back(node);};
    virtual bool contains(const Node& n) const override {return n == node;};
    virtual uint64_t node_count() const override {return 1;}
    virtual bool is_range() const override {return false;}
    virtual void display(const std::string& indent, std::ostream& o) const override
    {
        o << indent << "node_spec for individual node \"" << node << "\"";
    };
    virtual ~individual_node() override {};
};

class node_range : public node_spec
{
    // "sun[00-15]" is sun00, sun01, ... sun15.

    // If the first number is higher than the last number, they are swapped,
    // so "sun[15-00]" expands the same way as "sun[00-15]".

public:
    std::string prefix {};
    std::string first_digits {};
    std::string last_digits {};
    uint64_t first {0};
    uint64_t last {0};

    node_range(const std::string& s, const std::string& prefix, const std::string& first_digits, const std::string& last_digits);
        // throws noderange_error

    unsigned int width() const {return first_digits.length();}

    virtual void add_to_node_list(NodeSequence&) const override;
    virtual bool contains(const Node&) const override;
    virtual uint64_t node_count() const override {return 1 + last - first;}
    virtual bool is_range() const override {return true;}
    virtual void display(const std::string& indent, std::ostream& o) const override
    {
        o << indent << "node_spec for node range - prefix \"" << prefix << "\" from " << first_digits << " to " << last_digits;
    };
    virtual ~node_range() override {};
};
