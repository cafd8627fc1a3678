// ============================================================================
//  File: src/minitest_common.hpp  Shared helpers for the minitest runners
//
//  Each runner takes the test data directory as argv[1]; without it the
//  directory configured at build time (OLC_TEST_DATA_DIR) is used.
// ============================================================================
#pragma once

#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#ifndef OLC_TEST_DATA_DIR
#define OLC_TEST_DATA_DIR "test_data"
#endif

// ------------------ minimal ASSERT ------------------------------------------
#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

static inline bool close_to(double a, double b, double tol){ return std::abs(a - b) <= tol; }

static std::string g_data_dir = OLC_TEST_DATA_DIR;

static inline void init_data_dir(int argc, char** argv){
    if(argc > 1) g_data_dir = argv[1];
}

// Reads a CSV file, skipping blank lines and '#' comments.
static inline bool load_csv(const std::string& name, std::vector<std::vector<std::string>>& rows){
    std::string path = g_data_dir + "/" + name;
    std::ifstream in(path);
    if(!in.is_open()){
        std::cerr << "TestData: file not found: " << path << "\n";
        return false;
    }
    std::string line;
    while(std::getline(in, line)){
        if(!line.empty() && line.back() == '\r') line.pop_back();
        if(line.empty() || line[0] == '#') continue;
        std::vector<std::string> fields;
        std::stringstream ss(line);
        std::string field;
        while(std::getline(ss, field, ',')) fields.push_back(field);
        rows.push_back(fields);
    }
    return !rows.empty();
}

static inline bool report(const char* name, bool ok){
    std::cout << (ok ? "[OK] " : "[FAIL] ") << name << "\n";
    return ok;
}
