#ifndef CKSCAN_ANALYSIS_LCOM_HPP
#define CKSCAN_ANALYSIS_LCOM_HPP

/**
 * @file lcom.hpp
 * @brief LCOM4 cohesion metric.
 *
 * LCOM4 counts the connected components of a graph whose vertices are the
 * methods of a class and whose edges join two methods that use at least one
 * common field. 1 means fully cohesive; n > 1 means the class holds n
 * independent groups of behavior.
 */

#include <set>
#include <string>
#include <vector>

namespace ckscan::analysis {

    /**
     * What one method of a class looks like to the cohesion and
     * complexity metrics.
     */
    struct MethodFacts {
        std::string name;
        /// Cyclomatic complexity, always >= 1.
        int complexity = 1;
        /// Fields of its own instance the method body refers to.
        std::set<std::string> used_fields;
    };

    /**
     * Computes LCOM4.
     *
     * @param methods Methods of the class with their used-field sets.
     * @param field_count Number of fields declared by the class.
     * @return 0 without methods; the method count when the class has no
     *         fields; otherwise the number of connected components.
     */
    [[nodiscard]] int calculate_lcom4(const std::vector<MethodFacts>& methods, std::size_t field_count);

}  // namespace ckscan::analysis

#endif //CKSCAN_ANALYSIS_LCOM_HPP
