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

// Converting between lists of node names and node range notation like "node[00-06],node08,node[10-23]".

// Each function takes a sequence of text fragments, such as command line arguments.
// Each fragment may itself hold several node names or node ranges separated by commas and/or whitespace.

// All of these throw noderange_error on the first bad token, and nothing is returned for the
// tokens that came before it.  With no tokens at all they throw noderange_error EmptyInput.

#include <list>
#include <memory>
#include <string>
#include <vector>

#include "noderange_error.h"
#include "node_sequence.h"
#include "node_spec.h"

std::list<std::unique_ptr<node_spec>> parse_node_specs(const std::vector<std::string>& fragments);

void check_expansion_size(const std::list<std::unique_ptr<node_spec>>&);
    // throws noderange_error TooManyNodes if expanding would produce more than NR_MAX_EXPANDED_NODES nodes.

NodeSequence expand(const std::vector<std::string>& fragments);
    // Nodes in the order written, ranges expanded in ascending order.  Not sorted, and duplicates are kept.

NodeSequence expand_unique(const std::vector<std::string>& fragments);
    // Sorted into canonical order with duplicates removed.

std::string condense(const std::vector<std::string>& fragments);
    // "node00 node02,node01,node03" -> "node[00-03]"

std::string condense_nodes(NodeSequence);
    // Sorts, removes duplicates, and condenses nodes that have already been expanded.

bool is_node_in_range(const std::string& target, const std::vector<std::string>& fragments);
    // throws noderange_error InvalidNodeSyntax if target isn't a node name.

// single string convenience versions
inline NodeSequence expand(const std::string& s)                                  { return expand(std::vector<std::string>{s}); }
inline NodeSequence expand_unique(const std::string& s)                           { return expand_unique(std::vector<std::string>{s}); }
inline std::string  condense(const std::string& s)                                { return condense(std::vector<std::string>{s}); }
inline bool         is_node_in_range(const std::string& target, const std::string& s) { return is_node_in_range(target, std::vector<std::string>{s}); }
