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
#include <vector>
#include <string>

#include "node_list.h"

static int failures {0};

static void check(bool ok, const std::string& what)
{
    std::cout << (ok ? "ok     - " : "FAILED - ") << what << std::endl;
    if (!ok) failures++;
}

static bool contains(const std::string& haystack, const std::string& needle)
{
    return std::string::npos != haystack.find(needle);
}

int main(int argc, char* argv[])
{
    {
        node_list nl;

        bool ok = nl.compile("cn[00-03], cn07");

        std::ostringstream o; o << nl;
        std::string json = o.str();
        std::cout << json << std::endl;

        check(ok && nl.successful_compile && !nl.unsuccessful_compile, "\"cn[00-03], cn07\" compiles");
        check(5 == nl.nodes.size(),                     "\"cn[00-03], cn07\" is 5 nodes");
        check(nl.has_node_range,                        "\"cn[00-03], cn07\" has a node range");
        check(nl.condensed() == "cn[00-03],cn07",       "condensed() is cn[00-03],cn07");
        check(contains(json, "\"count\" : 5"),          "JSON has \"count\" : 5");
        check(contains(json, "\"condensed\" : \"cn[00-03],cn07\""), "JSON has the condensed form");
        check(contains(json, "\"nodes\" : [ \"cn00\", \"cn01\", \"cn02\", \"cn03\", \"cn07\" ]"), "JSON lists the nodes in order");
        check(contains(json, "\"successful_compile\" : true"), "JSON has \"successful_compile\" : true");
    }

    {
        node_list nl;
        bool ok = nl.compile("aardvark07");
        check(ok && 1 == nl.nodes.size() && !nl.has_node_range, "a single node name compiles without a node range");
    }

    {
        node_list nl;
        std::vector<std::string> fragments {"b2", "b1,b1", "b[3-4]"};
        bool ok = nl.compile(fragments);
        check(ok && nl.source_string == "b2 b1,b1 b[3-4]", "fragments are joined with a space");
        check(5 == nl.nodes.size(),                          "duplicates are kept in the node list");
        check(nl.condensed() == "b[1-4]",                    "condensed() sorts and removes duplicates");
    }

    {
        node_list nl;
        bool ok = nl.compile("");
        check(ok && nl.successful_compile && nl.nodes.empty(), "empty node list compiles");
        check(nl.message == "node list expression evaluated to null string", "empty node list message");
        check(nl.condensed() == "", "empty node list condenses to the null string");
    }

    {
        node_list nl;
        bool ok = nl.compile("cn01 fh%a cn02");

        std::ostringstream o; o << nl;
        std::cout << o.str() << std::endl;

        check(!ok && nl.unsuccessful_compile && !nl.successful_compile, "\"cn01 fh%a cn02\" doesn't compile");
        check(contains(nl.message, "Unsuccessful compile"), "message says \"Unsuccessful compile\"");
        check(contains(nl.message, "fh%a"),                 "message names the offending token");
        check(nl.nodes.empty(),                             "no nodes after an unsuccessful compile");
        check(contains(o.str(), "\"unsuccessful_compile\" : true"), "JSON has \"unsuccessful_compile\" : true");
    }

    {
        node_list nl;
        bool ok = nl.compile("n[000000000000000000-999999999999999999]");
        check(!ok && nl.unsuccessful_compile && nl.nodes.empty() && contains(nl.message, "limit"), "a node list too big to expand doesn't compile");
    }

    {
        node_list nl;
        nl.compile("x[1-22]");
        bool ok = nl.compile("y1");
        check(ok && 1 == nl.nodes.size() && !nl.has_node_range && nl.source_string == "y1", "a second compile starts from scratch");
    }

    std::cout << std::endl << (failures ? "FAILED" : "PASSED") << " - " << failures << " failure" << (1 == failures ? "" : "s") << "." << std::endl;

    return failures ? 1 : 0;
}
