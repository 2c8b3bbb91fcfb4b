#include "ckscan/analysis/lcom.hpp"

namespace ckscan::analysis {

    namespace {

        bool share_field(const std::set<std::string>& a, const std::set<std::string>& b) {
            // Both sets are ordered, so a merge-style scan is enough.
            auto ia = a.begin();
            auto ib = b.begin();
            while (ia != a.end() && ib != b.end()) {
                if (*ia < *ib) {
                    ++ia;
                } else if (*ib < *ia) {
                    ++ib;
                } else {
                    return true;
                }
            }
            return false;
        }

    }  // namespace

    int calculate_lcom4(const std::vector<MethodFacts>& methods, const std::size_t field_count) {
        const std::size_t n = methods.size();
        if (n == 0) {
            return 0;
        }
        if (field_count == 0) {
            return static_cast<int>(n);
        }

        std::vector<std::vector<std::size_t>> adjacency(n);
        for (std::size_t i = 0; i < n; ++i) {
            for (std::size_t j = i + 1; j < n; ++j) {
                if (share_field(methods[i].used_fields, methods[j].used_fields)) {
                    adjacency[i].push_back(j);
                    adjacency[j].push_back(i);
                }
            }
        }

        std::vector<bool> visited(n, false);
        std::vector<std::size_t> stack;
        int components = 0;

        for (std::size_t start = 0; start < n; ++start) {
            if (visited[start]) {
                continue;
            }

            ++components;
            visited[start] = true;
            stack.push_back(start);

            while (!stack.empty()) {
                const std::size_t current = stack.back();
                stack.pop_back();

                for (const std::size_t next : adjacency[current]) {
                    if (!visited[next]) {
                        visited[next] = true;
                        stack.push_back(next);
                    }
                }
            }
        }

        return components;
    }

}  // namespace ckscan::analysis
