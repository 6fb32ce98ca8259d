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
#include <string>

#include "Node.h"

typedef std::list<Node> NodeSequence;

void sort_nodes(NodeSequence&);
    // Stable sort into canonical order - prefix, then suffix width, then value.

void dedup(NodeSequence&);
    // Keeps the first of each run of equal nodes.  Only meaningful on a sorted sequence.

std::string condense_sorted(const NodeSequence&);
    // Input must be sorted and duplicate free.  Returns comma separated
    // node names and node ranges, e.g. "node[00-03],node[06-07],node09".

std::string join(const NodeSequence&, const std::string& separator = " ");
