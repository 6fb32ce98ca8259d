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

#include "node_sequence.h"

void sort_nodes(NodeSequence& nodes)
{
    nodes.sort();  // std::list::sort() is stable.
}

void dedup(NodeSequence& nodes)
{
    if (nodes.empty()) return;

    auto previous = nodes.begin();
    auto it = previous; it++;

    while (it != nodes.end())
    {
        if (*it == *previous)
        {
            it = nodes.erase(it);
        }
        else
        {
            previous = it++;
        }
    }

    return;
}

static void print_run(std::ostream& o, const Node& first_in_run, const Node& last_in_run, bool& need_comma)
{
    if (need_comma) o << ',';
    need_comma = true;

    if (first_in_run == last_in_run)
    {
        o << first_in_run.name();
    }
    else
    {
        o << first_in_run.get_prefix()
          << '[' << first_in_run.get_suffix_digits()
          << '-' << last_in_run.get_suffix_digits() << ']';
    }
}

std::string condense_sorted(const NodeSequence& nodes)
{
    if (nodes.empty()) return "";

    std::ostringstream o;
    bool need_comma {false};

    // We don't output a run like node[00-03] until we know we have seen the end of it.
    // first_in_run and last_in_run accumulate the run seen so far that has not yet been printed.

    auto it = nodes.begin();

    const Node* p_first_in_run = &(*it);
    const Node* p_last_in_run  = &(*it);

    for (it++; it != nodes.end(); it++)
    {
        if (is_successor(*p_last_in_run, *it))
        {
            p_last_in_run = &(*it);
        }
        else
        {
            print_run(o, *p_first_in_run, *p_last_in_run, need_comma);
            p_first_in_run = p_last_in_run = &(*it);
        }
    }

    // end of sequence - output the last run as yet unprinted
    print_run(o, *p_first_in_run, *p_last_in_run, need_comma);

    return o.str();
}

std::string join(const NodeSequence& nodes, const std::string& separator)
{
    std::ostringstream o;
    bool need_separator {false};
    for (auto& n : nodes)
    {
        if (need_separator) o << separator;
        need_separator = true;
        o << n.name();
    }
    return o.str();
}
