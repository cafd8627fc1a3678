// ============================================================================
//  File: src/minitest_validator.cpp  valid / short / full classification
//
//  Vectors:  test_data/validity_tests.csv  (code,isValid,isShort,isFull)
// ============================================================================

#include <random>
#include <string>
#include <vector>

#include "CodeValidator.hpp"
#include "OpenLocationCode.hpp"
#include "minitest_common.hpp"

using namespace olc;

static bool test_validity_vectors(){
    std::vector<std::vector<std::string>> rows;
    T_ASSERT( load_csv("validity_tests.csv", rows) );
    for(const auto& row : rows){
        T_ASSERT( row.size() == 4 );
        const std::string& code = row[0];
        bool valid = isValid(code), shortCode = isShort(code), full = isFull(code);
        if(valid != (row[1] == "true") || shortCode != (row[2] == "true") || full != (row[3] == "true")){
            std::cerr << "classification of '" << code << "' = " << valid << "," << shortCode << "," << full
                      << ", expected " << row[1] << "," << row[2] << "," << row[3] << "\n";
            return false;
        }
    }
    return true;
}

static bool test_reference_code(){
    T_ASSERT( isValid("8FVC2222+22") );
    T_ASSERT( !isShort("8FVC2222+22") );
    T_ASSERT( isFull("8FVC2222+22") );
    return true;
}

static bool test_separator_rules(){
    T_ASSERT( !isValid("8FVC2222") );           // missing
    T_ASSERT( !isValid("8FVC22+22+22") );       // repeated
    T_ASSERT( !isValid("8FVC222+222") );        // odd position
    T_ASSERT( !isValid("8FVC22222+22") );       // past position 8
    T_ASSERT( isValid("8FVC22+22") );
    return true;
}

static bool test_padding_rules(){
    T_ASSERT( isFull("8FVC0000+") );
    T_ASSERT( isFull("8F000000+") );
    T_ASSERT( !isValid("00000000+") );          // leading padding
    T_ASSERT( !isValid("8FVC0000+22") );        // digits after padding
    T_ASSERT( !isValid("8F00C000+") );          // two runs
    T_ASSERT( !isValid("8FV00000+") );          // odd run
    T_ASSERT( !isValid("VC00+") );              // padded short code
    return true;
}

static bool test_trailing_digit_rules(){
    T_ASSERT( !isValid("8FVC2222+2") );
    T_ASSERT( isValid("8FVC2222+223") );
    T_ASSERT( isValid("8FVC2222+") );
    return true;
}

// Every encoded code is full, every prefix-trimmed one short, never both.
static bool test_short_full_exclusive(){
    std::mt19937 rng(1701u);
    std::uniform_real_distribution<double> lat(-90.0, 90.0);
    std::uniform_real_distribution<double> lng(-180.0, 180.0);
    const int lengths[] = {2, 4, 6, 8, 10, 11, 12, 15};
    for(int i = 0; i < 2000; ++i){
        std::string code = encode(lat(rng), lng(rng), lengths[i % 8]);
        T_ASSERT( isValid(code) );
        T_ASSERT( isFull(code) != isShort(code) );
        T_ASSERT( isFull(code) );
        if(code.find(PADDING_CHARACTER) == std::string::npos){
            for(int drop : {2, 4, 6, 8}){
                std::string trimmed = code.substr(drop);
                if(isValid(trimmed)){
                    T_ASSERT( isShort(trimmed) );
                    T_ASSERT( !isFull(trimmed) );
                }
            }
        }
    }
    return true;
}

int main(int argc, char** argv){
    init_data_dir(argc, argv);
    bool ok = true;

    ok &= report("validity vectors", test_validity_vectors());
    ok &= report("reference code", test_reference_code());
    ok &= report("separator rules", test_separator_rules());
    ok &= report("padding rules", test_padding_rules());
    ok &= report("trailing digit rules", test_trailing_digit_rules());
    ok &= report("short/full exclusive", test_short_full_exclusive());

    std::cout << (ok ? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok ? 0 : 1;
}
