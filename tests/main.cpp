#include <iostream>
#include <exception>
// Runs the assert-style smoke checks first, then every GoogleTest case compiled
// into this binary (we link GTest::gtest, not gtest_main).
#include <gtest/gtest.h>

void run_span_smoke_test();
void run_pegtl_grammar_smoke_test();

int main(int argc, char** argv){
    try{
        // Span arithmetic
        run_span_smoke_test();
        // Raw PEGTL rules, no actions
        run_pegtl_grammar_smoke_test();
    }catch(const std::exception& e){ std::cerr << "[smoke] exception: " << e.what() << "\n"; return 1; }

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
