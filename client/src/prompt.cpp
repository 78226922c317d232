#include "coursesync/client/prompt.hpp"

#include "coursesync/errors.hpp"

namespace coursesync::client
{

    Prompt::Prompt(std::istream &in, std::ostream &out) : in_(in), out_(out) {}

    SelectionMode Prompt::ask_mode(std::size_t course_count)
    {
        out_ << "\nFound " << course_count << " course(s).\n"
             << "Download options:\n"
             << "  1) All courses\n"
             << "  2) Specific course(s)\n"
             << "  3) Current term courses\n"
             << "  4) Specific term(s)\n\n";
        const auto answer = read_line("Enter 1, 2, 3, or 4: ");
        if (answer == "1")
        {
            return SelectionMode::All;
        }
        if (answer == "2")
        {
            return SelectionMode::ByIndex;
        }
        if (answer == "3")
        {
            return SelectionMode::CurrentTerm;
        }
        if (answer == "4")
        {
            return SelectionMode::ByTerm;
        }
        throw SelectionError(ErrorCode::InvalidSelection, "Unknown option '" + answer + "'");
    }

    std::string Prompt::ask_courses(const std::vector<model::Course> &courses)
    {
        for (std::size_t i = 0; i < courses.size(); ++i)
        {
            out_ << "  " << (i + 1) << ") " << courses[i].name << " [" << courses[i].term_name() << "]\n";
        }
        return read_line("\nEnter course numbers separated by spaces: ");
    }

    std::string Prompt::ask_terms(const std::vector<model::Term> &terms)
    {
        for (std::size_t i = 0; i < terms.size(); ++i)
        {
            out_ << "  " << (i + 1) << ") " << terms[i].name << "\n";
        }
        return read_line("Enter term numbers (comma-separated): ");
    }

    std::string Prompt::read_line(const std::string &question)
    {
        out_ << question << std::flush;
        std::string line;
        if (!std::getline(in_, line))
        {
            throw SelectionError(ErrorCode::EmptySelection, "No input received");
        }
        const auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos)
        {
            return {};
        }
        const auto last = line.find_last_not_of(" \t\r");
        return line.substr(first, last - first + 1);
    }

} // namespace coursesync::client
