#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "coursesync/client/selector.hpp"
#include "coursesync/model.hpp"

namespace coursesync::client
{

    // Interactive front end for the selector. Reads one line per question; end of
    // input or an unknown option raises SelectionError.
    class Prompt
    {
    public:
        Prompt(std::istream &in, std::ostream &out);

        SelectionMode ask_mode(std::size_t course_count);

        std::string ask_courses(const std::vector<model::Course> &courses);

        std::string ask_terms(const std::vector<model::Term> &terms);

    private:
        std::string read_line(const std::string &question);

        std::istream &in_;
        std::ostream &out_;
    };

} // namespace coursesync::client
