#include "coursesync/client/catalog.hpp"

#include <utility>

namespace coursesync::client
{

    CourseCatalog::CourseCatalog(Paginator &paginator, std::string api_root, Logger &logger)
        : paginator_(paginator), api_root_(std::move(api_root)), logger_(logger) {}

    QueryParams CourseCatalog::discovery_params()
    {
        return {
            {"include[]", "term"},
            {"enrollment_state[]", "active"},
            {"enrollment_state[]", "invited_or_pending"},
            {"enrollment_state[]", "completed"},
            {"state[]", "all"},
        };
    }

    CourseDiscovery CourseCatalog::discover()
    {
        logger_.info("catalog", "Fetching courses (any enrollment, any workflow state)");
        const auto pages = paginator_.fetch_all(api_root_ + "/courses", discovery_params(), PaginationStyle::PageCounter);

        CourseDiscovery discovery;
        for (const auto &entry : pages)
        {
            if (!entry.is_object())
            {
                continue;
            }
            auto course = entry.get<model::Course>();
            if (course.workflow_state == "unpublished")
            {
                ++discovery.unpublished_skipped;
                continue;
            }
            discovery.courses.push_back(std::move(course));
        }

        if (discovery.unpublished_skipped > 0)
        {
            logger_.warn("catalog", "Skipping ", discovery.unpublished_skipped, " unpublished course(s)");
        }
        logger_.info("catalog", "Found ", discovery.courses.size(), " course(s)");
        return discovery;
    }

} // namespace coursesync::client
