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
#include <stdexcept>

#include "nrdefines.h"
#include "nrhelpers.h"
#include "noderange.h"
#include "node_list.h"
#include "noderange_options.h"
#include "logger.h"

int main(int argc, char* argv[])
{
    noderange_options opts;

    auto rv = opts.parse(argc, argv);

    if (!rv.first)
    {
        std::cerr << "<Error> " << rv.second << std::endl << usage_message(basename_of(opts.executable_name));
        return -1;
    }

    if (opts.help)
    {
        std::cout << "noderange version " << noderange_version << std::endl << usage_message(basename_of(opts.executable_name));
        return 0;
    }

    logger logfile {opts.logfilename};

    try
    {
        if (opts.routine_logging)
        {
            std::ostringstream o;
            o << "noderange version " << noderange_version << " invoked as";
            for (int i=0; i < argc; i++) o << " " << quote_wrap(std::string(argv[i]));
            o << " - mode " << nr_mode_to_string(opts.mode) << ".";
            log(logfile, o.str());
        }

        if (opts.json)
        {
            node_list nl;

            bool ok = nl.compile(opts.node_arguments);

            std::cout << nl << std::endl;

            if (opts.routine_logging)
            {
                std::ostringstream o;
                o << (ok ? "compiled " : "failed to compile ") << nl.nodes.size() << " nodes.";
                log(logfile, o.str());
            }

            return ok ? 0 : -1;
        }

        switch (opts.mode)
        {
            case nr_mode::n2r:
            {
                std::string condensed = condense(opts.node_arguments);
                std::cout << condensed << std::endl;
                if (opts.routine_logging) log(logfile, std::string("condensed to \"") + condensed + std::string("\"."));
                break;
            }

            case nr_mode::r2n:
            {
                NodeSequence nodes = opts.unique ? expand_unique(opts.node_arguments) : expand(opts.node_arguments);
                std::cout << join(nodes, opts.separator) << std::endl;
                if (opts.routine_logging)
                {
                    std::ostringstream o;
                    o << "expanded to " << nodes.size() << " nodes.";
                    log(logfile, o.str());
                }
                break;
            }

            case nr_mode::member:
            {
                bool is_member = is_node_in_range(opts.member_node, opts.node_arguments);
                std::cout << (is_member ? "true" : "false") << std::endl;
                if (opts.routine_logging) log(logfile, std::string("\"") + opts.member_node + (is_member ? "\" is" : "\" is not") + std::string(" in the node list."));
                return is_member ? 0 : 1;
            }

            case nr_mode::unspecified:
                std::cerr << "<Error> internal programming error - no mode after successful command line parse." << std::endl;
                return -1;
        }
    }
    catch (const noderange_error& e)
    {
        if (opts.routine_logging)
        {
            std::ostringstream o;
            o << "<Error> " << nr_error_kind_to_string(e.kind) << " - " << e.what();
            try { log(logfile, o.str()); }
            catch (const std::runtime_error& le) { std::cerr << le.what() << std::endl; }
        }
        std::cerr << "<Error> " << e.what() << std::endl;
        return -1;
    }
    catch (const std::runtime_error& e)
    {
        std::cerr << e.what() << std::endl;
        return -1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "<Error> " << e.what() << std::endl;
        return -1;
    }

    return 0;
}
