#include "common/io_utils.hpp"
#include <unistd.h>
#include <fstream>
#include <stdexcept>

namespace codejudge {
using namespace std;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string());
    if (!fin) throw runtime_error("Unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

bool is_writable_directory(const filesystem::path &dir) {
    error_code ec;
    return filesystem::is_directory(dir, ec) && access(dir.c_str(), W_OK) == 0;
}

}  // namespace codejudge
