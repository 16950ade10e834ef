#include <iostream>
#include <stdexcept>

namespace hs_test {

void taxonomy_correctness();
void lineage_correctness();
void aggregation_correctness();
void scoring_correctness();
void selection_correctness();
void pipeline_correctness();

} // namespace hs_test


int main()
{
    using namespace hs_test;

    try {
        taxonomy_correctness();
        lineage_correctness();
        aggregation_correctness();
        scoring_correctness();
        selection_correctness();
        pipeline_correctness();

        std::cout << "All tests passed." << std::endl;
        return 0;
    }
    catch (std::exception& e) {
        std::cout << "ERROR: " << e.what() << std::endl;
        return 1;
    }
}
