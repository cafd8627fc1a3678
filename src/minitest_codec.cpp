// ============================================================================
//  File: src/minitest_codec.cpp  Encode/decode vectors and round trip
//
//  Vectors:  test_data/encoding.csv  (lat,lng,length,code)
//            test_data/decoding.csv  (code,length,latLo,lngLo,latHi,lngHi)
// ============================================================================

#include <cmath>
#include <limits>
#include <random>
#include <string>
#include <vector>

#include "OpenLocationCode.hpp"
#include "minitest_common.hpp"

using namespace olc;

// ------------------ TEST A : reference vectors ------------------------------
static bool test_encoding_vectors(){
    std::vector<std::vector<std::string>> rows;
    T_ASSERT( load_csv("encoding.csv", rows) );
    for(const auto& row : rows){
        T_ASSERT( row.size() == 4 );
        double lat = std::stod(row[0]);
        double lng = std::stod(row[1]);
        int length = std::stoi(row[2]);
        auto code = tryEncode(lat, lng, length);
        if(!code.ok() || *code.value != row[3]){
            std::cerr << "encode(" << row[0] << "," << row[1] << "," << row[2] << ") = "
                      << (code.ok() ? *code.value : code.message) << ", expected " << row[3] << "\n";
            return false;
        }
    }
    return true;
}

static bool test_decoding_vectors(){
    std::vector<std::vector<std::string>> rows;
    T_ASSERT( load_csv("decoding.csv", rows) );
    for(const auto& row : rows){
        T_ASSERT( row.size() == 6 );
        auto area = tryDecode(row[0]);
        if(!area.ok()){
            std::cerr << "decode(" << row[0] << ") failed: " << area.message << "\n";
            return false;
        }
        const CodeArea& a = *area.value;
        T_ASSERT( a.codeLength == std::stoi(row[1]) );
        T_ASSERT( close_to(a.southLatitude, std::stod(row[2]), 1e-10) );
        T_ASSERT( close_to(a.westLongitude, std::stod(row[3]), 1e-10) );
        T_ASSERT( close_to(a.northLatitude(), std::stod(row[4]), 1e-10) );
        T_ASSERT( close_to(a.eastLongitude(), std::stod(row[5]), 1e-10) );
    }
    return true;
}

static bool test_known_cell(){
    T_ASSERT( encode(47.0000625, 8.0000625) == "8FVC2222+22" );

    CodeArea a = decode("8FVC2222+22");
    T_ASSERT( close_to(a.southLatitude, 47.0, 1e-12) );
    T_ASSERT( close_to(a.westLongitude, 8.0, 1e-12) );
    T_ASSERT( close_to(a.latitudeHeight, 0.000125, 1e-15) );
    T_ASSERT( close_to(a.longitudeWidth, 0.000125, 1e-15) );
    T_ASSERT( close_to(a.latitudeCenter, 47.0000625, 1e-12) );
    T_ASSERT( close_to(a.longitudeCenter, 8.0000625, 1e-12) );
    T_ASSERT( a.codeLength == 10 );
    return true;
}

// ------------------ TEST B : length and input errors ------------------------
static bool test_invalid_lengths(){
    for(int length : {-1, 0, 1, 3, 5, 7, 9}){
        auto code = tryEncode(47.0, 8.0, length);
        T_ASSERT( !code.ok() );
        T_ASSERT( code.error == ErrorKind::InvalidLength );
        T_ASSERT( std::string(errorKindName(code.error)) == "InvalidLength" );
    }
    bool thrown = false;
    try{
        encode(47.0, 8.0, 3);
    }catch(const OlcError& ex){
        thrown = ex.kind() == ErrorKind::InvalidLength;
    }
    T_ASSERT( thrown );

    for(int length : {2, 4, 6, 8, 10, 11, 12, 13, 14, 15}){
        T_ASSERT( tryEncode(47.0, 8.0, length).ok() );
    }
    T_ASSERT( encode(47.0, 8.0, 20) == encode(47.0, 8.0, MAX_CODE_LENGTH) );
    return true;
}

static bool test_non_finite_coordinates(){
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    T_ASSERT( tryEncode(nan, 8.0).error == ErrorKind::InvalidCoordinate );
    T_ASSERT( tryEncode(47.0, inf).error == ErrorKind::InvalidCoordinate );
    return true;
}

static bool test_decode_rejects_non_full(){
    for(const char* code : {"WC2345+G6", "8FWC2345+G", "", "hello", "8FWC2345G6+"}){
        auto area = tryDecode(code);
        T_ASSERT( !area.ok() );
        T_ASSERT( area.error == ErrorKind::NotFullCode );
        T_ASSERT( area.message.find(code) != std::string::npos );
    }
    bool thrown = false;
    try{
        decode("2345+G6");
    }catch(const OlcError& ex){
        thrown = ex.kind() == ErrorKind::NotFullCode;
    }
    T_ASSERT( thrown );
    return true;
}

// ------------------ TEST C : boundaries -------------------------------------
static bool test_north_pole_stays_inside_grid(){
    for(int length : {2, 4, 6, 8, 10, 11, 15}){
        CodeArea a = decode(encode(90.0, 0.0, length));
        T_ASSERT( a.northLatitude() <= 90.0 + 1e-9 );
        T_ASSERT( a.southLatitude < 90.0 );
    }
    T_ASSERT( encode(95.0, 1.0, 4) == encode(90.0, 1.0, 4) );
    T_ASSERT( encode(-95.0, 1.0, 4) == encode(-90.0, 1.0, 4) );
    return true;
}

static bool test_longitude_wraps(){
    T_ASSERT( encode(10.0, 180.0) == encode(10.0, -180.0) );
    T_ASSERT( encode(10.0, 200.0) == encode(10.0, -160.0) );
    T_ASSERT( encode(10.0, -540.0) == encode(10.0, -180.0) );
    T_ASSERT( encode(10.0, 3600.0 + 8.0) == encode(10.0, 8.0) );
    double far = normalizeLongitude(1e12 + 8.0);
    T_ASSERT( far >= -180.0 && far < 180.0 );
    T_ASSERT( normalizeLongitude(180.0) == -180.0 );
    T_ASSERT( clipLatitude(-100.0) == -90.0 );
    return true;
}

static bool test_precision_table(){
    const double expected[][2] = {
        {2, 20.0}, {4, 1.0}, {6, 0.05}, {8, 0.0025}, {10, 0.000125},
        {11, 0.000025}, {12, 0.000005}, {15, 0.00000004}
    };
    for(const auto& e : expected){
        T_ASSERT( close_to(precisionByLength(static_cast<int>(e[0])), e[1], e[1] * 1e-12) );
    }
    for(int length : {2, 4, 6, 8, 10, 11, 13, 15}){
        CodeArea a = decode(encode(12.3456789, 98.7654321, length));
        T_ASSERT( close_to(a.latitudeHeight, precisionByLength(length), 1e-12) );
    }
    return true;
}

static bool test_long_codes_truncate_to_max(){
    CodeArea a = decode("6FH32222+22222222");
    CodeArea b = decode("6FH32222+2222222");
    T_ASSERT( a.codeLength == MAX_CODE_LENGTH );
    T_ASSERT( a.southLatitude == b.southLatitude );
    T_ASSERT( a.westLongitude == b.westLongitude );
    return true;
}

// ------------------ TEST D : random round trip ------------------------------
static bool test_random_round_trip(){
    std::mt19937 rng(20191015u);
    std::uniform_real_distribution<double> lat(-90.0, 90.0);
    std::uniform_real_distribution<double> lng(-180.0, 180.0);
    for(int i = 0; i < 5000; ++i){
        double la = lat(rng), lo = lng(rng);
        CodeArea a = decode(encode(la, lo));
        if(!close_to(a.latitudeCenter, la, 0.01) || !close_to(a.longitudeCenter, lo, 0.01)){
            std::cerr << "round trip drift at " << la << "," << lo << "\n";
            return false;
        }
    }
    return true;
}

// ------------------ DRIVER ---------------------------------------------------
int main(int argc, char** argv){
    init_data_dir(argc, argv);
    bool ok = true;

    ok &= report("[A] encoding vectors", test_encoding_vectors());
    ok &= report("[A] decoding vectors", test_decoding_vectors());
    ok &= report("[A] known cell", test_known_cell());
    ok &= report("[B] invalid lengths", test_invalid_lengths());
    ok &= report("[B] non-finite coordinates", test_non_finite_coordinates());
    ok &= report("[B] decode rejects non-full", test_decode_rejects_non_full());
    ok &= report("[C] north pole", test_north_pole_stays_inside_grid());
    ok &= report("[C] longitude wrap", test_longitude_wraps());
    ok &= report("[C] precision table", test_precision_table());
    ok &= report("[C] long codes", test_long_codes_truncate_to_max());
    ok &= report("[D] random round trip", test_random_round_trip());

    std::cout << (ok ? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok ? 0 : 1;
}
