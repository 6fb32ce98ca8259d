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
#include "noderange.h"

std::list<std::unique_ptr<node_spec>> parse_node_specs(const std::vector<std::string>& fragments)
{
    std::list<std::unique_ptr<node_spec>> specs;

    for (auto& fragment : fragments)
    {
        for (auto& token : tokenize(fragment))
        {
            specs.push_back(parse_node_spec(token));
        }
    }

    if (specs.empty())
    {
        throw noderange_error(nr_error_kind::EmptyInput, "", "no node names or node ranges were given.");
    }

    return specs;
}

void check_expansion_size(const std::list<std::unique_ptr<node_spec>>& specs)
{
    uint64_t total {0};

    for (auto& p : specs)
    {
        total += p->node_count();

        if (total > NR_MAX_EXPANDED_NODES)
        {
            std::ostringstream o;
            o << "\"" << p->source << "\" brings the number of nodes to " << total
              << ", more than the limit of " << NR_MAX_EXPANDED_NODES << ".";
            throw noderange_error(nr_error_kind::TooManyNodes, p->source, o.str());
        }
    }
}

NodeSequence expand(const std::vector<std::string>& fragments)
{
    // all tokens are parsed before any range is expanded

    auto specs = parse_node_specs(fragments);

    check_expansion_size(specs);

    NodeSequence nodes;

    for (auto& p : specs) p->add_to_node_list(nodes);

    return nodes;
}

NodeSequence expand_unique(const std::vector<std::string>& fragments)
{
    NodeSequence nodes = expand(fragments);
    sort_nodes(nodes);
    dedup(nodes);
    return nodes;
}

std::string condense(const std::vector<std::string>& fragments)
{
    return condense_sorted(expand_unique(fragments));
}

std::string condense_nodes(NodeSequence nodes)
{
    sort_nodes(nodes);
    dedup(nodes);
    return condense_sorted(nodes);
}

bool is_node_in_range(const std::string& target, const std::vector<std::string>& fragments)
{
    Node node = Node::parse(target);

    auto specs = parse_node_specs(fragments);

    for (auto& p : specs)
    {
        if (p->contains(node)) return true;
    }

    return false;
}
