#pragma once

#include "pager/page_fetcher.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace sqlpager {

/**
 * @brief Human-readable and JSON view of a PagePlan
 */
class PlanExplainer {
public:
    struct JoinExplanation {
        std::string path;        // e.g. Book.store?.country
        std::string table;
        std::string join_type;
        std::string verdict;
        bool retained = true;
    };

    struct StatementExplanation {
        std::string sql;
        std::vector<std::string> params;
    };

    struct Explanation {
        std::string query_name;
        std::string dialect;
        std::string summary;
        StatementExplanation count_statement;
        StatementExplanation data_statement;
        std::vector<JoinExplanation> joins;
        size_t eliminated_count = 0;

        [[nodiscard]] nlohmann::json to_json() const;
    };

    [[nodiscard]] static Explanation explain(const PagePlan& plan);
};

} // namespace sqlpager
