#include <cassert>
#include <cstdio>
#include <fstream>
#include <string>

#include "bfrun/source.hxx"
#include "bfrun/vm.hxx"
#include "helpers.hxx"

static void writeFile(const char* path, const std::string& text) {
    std::ofstream f(path, std::ios::binary);
    f << text;
}

static void test_load_file() {
    const char* fname = "test_program.bf";
    writeFile(fname, "read ,\r\nwrite .\n");
    std::string code, err;
    assert(bfrun::readSource(fname, code, err));
    assert(code == "read ,\r\nwrite .\n");
    bfrun::Machine m;
    std::string out = run(code, m, "A");
    assert(out == "A");
    assert(m.cells[0] == static_cast<bfrun::Cell>('A'));
    std::remove(fname);
}

static void test_positions_from_file() {
    const char* fname = "test_positions.bf";
    writeFile(fname, "+ comment\n  comment <\n<");
    std::string code, err;
    assert(bfrun::readSource(fname, code, err));
    bfrun::Machine m;
    bfrun::Status ret;
    bfrun::Fault fault;
    run(code, m, "", &ret, &fault);
    assert(ret == bfrun::Status::PointerOutOfBounds);
    assert(fault.where.line == 2);
    assert(fault.where.column == 11);
    std::remove(fname);
}

static void test_empty_file() {
    const char* fname = "test_empty.bf";
    writeFile(fname, "");
    std::string code = "stale", err;
    assert(bfrun::readSource(fname, code, err));
    assert(code.empty());
    std::remove(fname);
}

static void test_missing_file() {
    std::string code = "unchanged", err;
    assert(!bfrun::readSource("definitely_missing_file.bf", code, err));
    assert(err == "Path does not exist");
    assert(code == "unchanged");
}

static void test_directory() {
    std::string code, err;
    assert(!bfrun::readSource(".", code, err));
    assert(err == "Target is not a file");
}

int main() {
    test_load_file();
    test_positions_from_file();
    test_empty_file();
    test_missing_file();
    test_directory();
    return 0;
}
