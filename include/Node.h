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
#include <iostream>
#include <stdint.h>

enum class Ordering { Less, Equal, Greater };

std::ostream& operator<< (std::ostream&, const Ordering&);

class Node
{
    // A node name is a prefix of letters and underscores, optionally ending in one
    // hyphen or underscore separator, followed by a numeric suffix, as in "node07" or "cn-0012".

    // The suffix is kept as written.  Its width (number of digits, counting leading zeros)
    // is part of the node's identity, so "node9" and "node09" are different nodes.

private:
// variables
    std::string prefix {};
    std::string suffix_digits {};
    uint64_t value {0};

public:
// methods
    Node(const std::string& prefix, const std::string& suffix_digits);
        // throws noderange_error InvalidNodeSyntax if prefix or suffix_digits are malformed

    Node(const std::string& prefix, uint64_t value, unsigned int width);
        // value is zero-padded on the left to width digits.  Throws if it doesn't fit.

    static Node parse(const std::string& name);  // throws noderange_error InvalidNodeSyntax

    const std::string& get_prefix() const {return prefix;}
    const std::string& get_suffix_digits() const {return suffix_digits;}
    unsigned int suffix_width() const {return suffix_digits.length();}
    uint64_t get_value() const {return value;}

    std::string name() const {return prefix + suffix_digits;}
};

std::string zero_padded(uint64_t value, unsigned int width);

Ordering compare(const Node& a, const Node& b);
    // Prefix first (case-sensitive), then suffix width, then numeric value.

inline bool operator< (const Node& a, const Node& b) {return Ordering::Less  == compare(a,b);}
inline bool operator==(const Node& a, const Node& b) {return Ordering::Equal == compare(a,b);}
inline bool operator!=(const Node& a, const Node& b) {return Ordering::Equal != compare(a,b);}

bool is_successor(const Node& a, const Node& b);
    // true if b is the very next node after a at the same prefix and width.
    // A node whose value is the largest that fits in its width, like "node99",
    // has no successor.  "node100" is a different width and so starts a new run.

std::ostream& operator<< (std::ostream&, const Node&);
