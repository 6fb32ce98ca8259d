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
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "logger.h"

std::string log_line(const nrtime& now, const nrtime& previous, const std::string& text)
{
    nrtime elapsed = (previous == nrtime_zero) ? nrtime_zero : now - previous;

    std::ostringstream o;

    o << now.format_as_datetime_with_ns() << " +" << elapsed.format_as_duration_HMMSSns() << " " << text;

    if (text.empty() || '\n' != text[text.length()-1]) o << '\n';

    return o.str();
}

void log(logger& l, const std::string& text)
{
    std::lock_guard<std::mutex> guard(l.writing);

    nrtime now; now.setToNow();

    std::string line = log_line(now, l.previous_line_time, text);

    if (l.to_standard_output())
    {
        std::cout << line << std::flush;
    }
    else
    {
        std::ofstream logfile(l.logfilename, std::ios::out | std::ios::app);

        if (!logfile.is_open())
        {
            std::ostringstream o;
            o << "<Error> failed to open log file \"" << l.logfilename << "\" to append \"" << text << "\".";
            throw std::runtime_error(o.str());
        }

        logfile << line;
        logfile.flush();

        if (logfile.fail())
        {
            std::ostringstream o;
            o << "<Error> failed writing to log file \"" << l.logfilename << "\".";
            throw std::runtime_error(o.str());
        }
    }

    l.previous_line_time = now;
    l.lines_logged++;
}
