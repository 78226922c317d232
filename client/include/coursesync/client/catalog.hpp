#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "coursesync/client/logger.hpp"
#include "coursesync/client/paginator.hpp"
#include "coursesync/model.hpp"

namespace coursesync::client
{

    struct CourseDiscovery
    {
        std::vector<model::Course> courses;
        std::size_t unpublished_skipped{};
    };

    // Lists every course the account was ever enrolled in, minus unpublished ones.
    class CourseCatalog
    {
    public:
        CourseCatalog(Paginator &paginator, std::string api_root, Logger &logger);

        CourseDiscovery discover();

        static QueryParams discovery_params();

    private:
        Paginator &paginator_;
        std::string api_root_;
        Logger &logger_;
    };

} // namespace coursesync::client
