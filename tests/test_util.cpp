// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <gtest/gtest.h>
#include "test_util.hpp"

string read_file(const string &path) {
    ifstream in(path.c_str());
    ostringstream contents;
    contents << in.rdbuf();
    return contents.str();
}

vector<string> split_lines(const string &text) {
    vector<string> lines;
    istringstream in(text);
    string l;
    while (getline(in, l)) lines.push_back(l);
    return lines;
}

string temp_path(const string &name) {
    return ::testing::TempDir() + name;
}

vector<string> trace_body(const string &text) {
    vector<string> lines = split_lines(text);
    vector<string> body;
    bool in_body = false;
    for (vector<string>::const_iterator li = lines.begin();
         li != lines.end(); ++li) {
        if (in_body) body.push_back(*li);
        if (*li == "$enddefinitions $end") in_body = true;
    }
    return body;
}

vector<unsigned long long> trace_timestamps(const string &text) {
    vector<string> lines = split_lines(text);
    vector<unsigned long long> times;
    for (vector<string>::const_iterator li = lines.begin();
         li != lines.end(); ++li) {
        if (!li->empty() && (*li)[0] == '#') {
            times.push_back(strtoull(li->c_str() + 1, 0, 10));
        }
    }
    return times;
}
