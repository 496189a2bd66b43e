#include "common/io_utils.hpp"
#include <glog/logging.h>
#include <fstream>
#include <iterator>
#include "common/exceptions.hpp"

namespace dcx {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path, ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    if (!fout) throw internal_error("unable to open " + path.string() + " for writing");
    fout.write(content.data(), content.size());
    if (!fout) throw internal_error("unable to write " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath.find('/') != string::npos || subpath == "." || subpath == "..")
        throw invalid_argument("subpath is not safe " + subpath);
    return subpath;
}

void copy_directory(const fs::path &from, const fs::path &to) {
    error_code ec;
    fs::create_directories(to, ec);
    if (ec) throw internal_error("unable to create directory " + to.string() + ": " + ec.message());
    fs::copy(from, to, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    if (ec) throw internal_error("unable to copy " + from.string() + " to " + to.string() + ": " + ec.message());
}

void remove_directory_quietly(const fs::path &dir) {
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec) LOG(ERROR) << "Unable to delete directory " << dir << ": " << ec.message();
}

}  // namespace dcx
