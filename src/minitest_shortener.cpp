// ============================================================================
//  File: src/minitest_shortener.cpp  shorten / recoverNearest
//
//  Vectors:  test_data/short_code_tests.csv  (full,lat,lng,short,type)
//            type S = shorten only, R = recover only, B = both directions
// ============================================================================

#include <limits>
#include <random>
#include <string>
#include <vector>

#include "CodeShortener.hpp"
#include "OpenLocationCode.hpp"
#include "minitest_common.hpp"

using namespace olc;

static bool test_short_code_vectors(){
    std::vector<std::vector<std::string>> rows;
    T_ASSERT( load_csv("short_code_tests.csv", rows) );
    for(const auto& row : rows){
        T_ASSERT( row.size() == 5 );
        const std::string& fullCode = row[0];
        double lat = std::stod(row[1]);
        double lng = std::stod(row[2]);
        const std::string& shortCode = row[3];
        const std::string& type = row[4];

        if(type == "S" || type == "B"){
            std::string got = shorten(fullCode, lat, lng);
            if(got != shortCode){
                std::cerr << "shorten(" << fullCode << "," << row[1] << "," << row[2] << ") = " << got
                          << ", expected " << shortCode << "\n";
                return false;
            }
        }
        if(type == "R" || type == "B"){
            std::string got = recoverNearest(shortCode, lat, lng);
            if(got != fullCode){
                std::cerr << "recoverNearest(" << shortCode << "," << row[1] << "," << row[2] << ") = " << got
                          << ", expected " << fullCode << "\n";
                return false;
            }
        }
    }
    return true;
}

static bool test_shorten_errors(){
    auto padded = tryShorten("8FVC0000+", 47.0, 8.0);
    T_ASSERT( !padded.ok() );
    T_ASSERT( padded.error == ErrorKind::PaddedCode );

    auto notFull = tryShorten("C2222+22", 47.0, 8.0);
    T_ASSERT( notFull.error == ErrorKind::NotFullCode );
    T_ASSERT( tryShorten("garbage", 47.0, 8.0).error == ErrorKind::NotFullCode );

    const double nan = std::numeric_limits<double>::quiet_NaN();
    T_ASSERT( tryShorten("8FVC2222+22", nan, 8.0).error == ErrorKind::InvalidCoordinate );

    bool thrown = false;
    try{
        shorten("8FWCX400+", 47.0, 8.0);
    }catch(const OlcError& ex){
        thrown = ex.kind() == ErrorKind::PaddedCode;
    }
    T_ASSERT( thrown );
    return true;
}

static bool test_shorten_prefers_largest_removal(){
    // Reference on the cell center: eight digits go.
    T_ASSERT( shorten("8FVC2222+22", 47.0000625, 8.0000625) == "+22" );
    // Outside 0.3 * 0.0025 but inside 0.3 * 0.05: six digits go.
    T_ASSERT( shorten("8FVC2222+22", 47.0100625, 8.0000625) == "22+22" );
    // Outside 0.3 * 0.05 but inside 0.3 * 1: four digits go.
    T_ASSERT( shorten("8FVC2222+22", 47.2000625, 8.0000625) == "2222+22" );
    // Far away: nothing is removed, only case is normalised.
    T_ASSERT( shorten("8fvc2222+22", 10.0, 100.0) == "8FVC2222+22" );
    return true;
}

static bool test_recover_errors(){
    auto bad = tryRecoverNearest("8FWC2345+G", 47.0, 8.0);
    T_ASSERT( !bad.ok() );
    T_ASSERT( bad.error == ErrorKind::NotValidShortCode );
    T_ASSERT( tryRecoverNearest("VC00+", 47.0, 8.0).error == ErrorKind::NotValidShortCode );

    const double inf = std::numeric_limits<double>::infinity();
    T_ASSERT( tryRecoverNearest("2222+22", 47.0, inf).error == ErrorKind::InvalidCoordinate );

    bool thrown = false;
    try{
        recoverNearest("not a code", 47.0, 8.0);
    }catch(const OlcError& ex){
        thrown = ex.kind() == ErrorKind::NotValidShortCode;
    }
    T_ASSERT( thrown );
    return true;
}

static bool test_recover_full_code_passthrough(){
    T_ASSERT( recoverNearest("8fvc2222+22", -10.0, 60.0) == "8FVC2222+22" );
    T_ASSERT( recoverNearest("8FVC2222+22", 0.0, 0.0) == "8FVC2222+22" );
    return true;
}

// A reference anywhere inside the cell kept by the short code recovers the
// full code it was shortened from.
static bool test_random_shorten_recover(){
    std::mt19937 rng(4242u);
    std::uniform_real_distribution<double> lat(-80.0, 80.0);
    std::uniform_real_distribution<double> lng(-179.0, 179.0);
    std::uniform_real_distribution<double> inside(0.1, 0.9);
    const int prefixLengths[] = {4, 6, 8};
    for(int i = 0; i < 3000; ++i){
        std::string code = encode(lat(rng), lng(rng), i % 2 ? 10 : 11);
        int keep = prefixLengths[i % 3];
        std::string prefix = code.substr(0, keep);
        prefix.append(SEPARATOR_POSITION - keep, PADDING_CHARACTER);
        prefix.push_back(SEPARATOR);
        CodeArea cell = decode(prefix);
        double refLat = cell.southLatitude + cell.latitudeHeight * inside(rng);
        double refLng = cell.westLongitude + cell.longitudeWidth * inside(rng);

        std::string shortCode = shorten(code, refLat, refLng);
        std::string recovered = recoverNearest(shortCode, refLat, refLng);
        if(recovered != code){
            std::cerr << code << " -> " << shortCode << " -> " << recovered
                      << " at " << refLat << "," << refLng << "\n";
            return false;
        }
    }
    return true;
}

int main(int argc, char** argv){
    init_data_dir(argc, argv);
    bool ok = true;

    ok &= report("short code vectors", test_short_code_vectors());
    ok &= report("shorten errors", test_shorten_errors());
    ok &= report("shorten removal order", test_shorten_prefers_largest_removal());
    ok &= report("recover errors", test_recover_errors());
    ok &= report("recover full passthrough", test_recover_full_code_passthrough());
    ok &= report("random shorten/recover", test_random_shorten_recover());

    std::cout << (ok ? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok ? 0 : 1;
}
