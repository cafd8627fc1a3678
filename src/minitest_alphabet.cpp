// ============================================================================
//  File: src/minitest_alphabet.cpp  Digit table lookups
// ============================================================================

#include <string>

#include "CodeAlphabet.hpp"
#include "minitest_common.hpp"

using namespace olc;

static bool test_every_symbol_maps_to_its_index(){
    for(int digit = 0; digit < ENCODING_BASE; ++digit){
        char symbol = CODE_ALPHABET[digit];
        T_ASSERT( digitValue(symbol) == digit );
        T_ASSERT( digitSymbol(digit) == symbol );
    }
    return true;
}

static bool test_lowercase_is_accepted(){
    T_ASSERT( digitValue('c') == digitValue('C') );
    T_ASSERT( digitValue('x') == 19 );
    T_ASSERT( digitValue('f') == 9 );
    T_ASSERT( isCodeDigit('v') );
    return true;
}

static bool test_padding_and_separator_are_sentinels(){
    T_ASSERT( digitValue(PADDING_CHARACTER) == PADDING_OR_SEPARATOR_DIGIT );
    T_ASSERT( digitValue(SEPARATOR) == PADDING_OR_SEPARATOR_DIGIT );
    T_ASSERT( !isCodeDigit(PADDING_CHARACTER) );
    T_ASSERT( !isCodeDigit(SEPARATOR) );
    return true;
}

static bool test_foreign_characters_are_rejected(){
    const std::string foreign = "01AaBIiLlOoUuYZz_ -";
    for(char c : foreign){
        if(c == PADDING_CHARACTER) continue;
        T_ASSERT( digitValue(c) == NOT_A_DIGIT );
    }
    T_ASSERT( digitValue(static_cast<char>(0xCE)) == NOT_A_DIGIT );
    T_ASSERT( &digitTable() == &digitTable() );
    return true;
}

static bool test_significant_digits(){
    T_ASSERT( significantDigits("8fwc2345+g6") == "8FWC2345G6" );
    T_ASSERT( significantDigits("8FWCX400+") == "8FWCX4" );
    T_ASSERT( significantDigits("+") == "" );
    return true;
}

int main(int argc, char** argv){
    init_data_dir(argc, argv);
    bool ok = true;

    ok &= report("symbol <-> index", test_every_symbol_maps_to_its_index());
    ok &= report("lowercase symbols", test_lowercase_is_accepted());
    ok &= report("padding/separator sentinel", test_padding_and_separator_are_sentinels());
    ok &= report("foreign characters", test_foreign_characters_are_rejected());
    ok &= report("significant digits", test_significant_digits());

    std::cout << (ok ? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok ? 0 : 1;
}
