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
#include <stdexcept>
#include <sstream>

#include "nrhelpers.h"
#include "noderange.h"
#include "node_list.h"


std::ostream& operator<< (std::ostream& o, const node_list& nl)
{
    o << "{ ";

    o << "\"source_string\" : " << quote_wrap(nl.source_string);

    o << ", \"message\" : " << quote_wrap(nl.message);

    o << ", \"count\" : " << nl.nodes.size();

    o << ", \"nodes\" : [ ";

        bool need_comma {false};
        for (auto& n: nl.nodes)
        {
            if (need_comma) o << ", ";
            need_comma = true;

            o << quote_wrap(n.name());
        }

    o << " ]";

    o << ", \"condensed\" : " << quote_wrap(nl.condensed());

    o <<  ", \"successful_compile\" : "   << (nl.successful_compile   ? "true" : "false" );
    o <<  ", \"unsuccessful_compile\" : " << (nl.unsuccessful_compile ? "true" : "false" );
    o <<  ", \"has_node_range\" : "       << (nl.has_node_range       ? "true" : "false" );

    o << " }";

    return o;
}

std::string node_list::condensed() const
{
    if (nodes.empty()) return "";

    return condense_nodes(nodes);
}

bool node_list::compile(const std::vector<std::string>& fragments)
{
    std::ostringstream o;
    bool need_space {false};
    for (auto& f : fragments)
    {
        if (need_space) o << ' ';
        need_space = true;
        o << f;
    }
    return compile(o.str());
}

bool node_list::compile(const std::string& s)
{
    clear();

    source_string = s;

    if (tokenize(s).empty())
    {
        successful_compile = true;
        message = "node list expression evaluated to null string";
        return true;
    }

    try
    {
        auto specs = parse_node_specs(std::vector<std::string>{s});

        check_expansion_size(specs);

        for (auto& p : specs)
        {
            if (p->is_range()) has_node_range = true;
            p->add_to_node_list(nodes);
        }
    }
    catch (const noderange_error& e)
    {
        nodes.clear();
        has_node_range = false;

        std::ostringstream o;

        o << "Unsuccessful compile of node list \"" << s << "\" - " << e.what() << std::endl << std::endl
          << "Example of a node list - \"aardvark07, scooter[00-15], cn-[000-127]\"." << std::endl;

        describe_node_range_syntax(o);

        error(o.str());

        return false;
    }

    successful_compile = true;
    message += "Successful compile.";

    return true;
}
