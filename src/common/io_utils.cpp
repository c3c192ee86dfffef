#include "starjudge/common/io_utils.hpp"
#include <fstream>
#include "starjudge/common/exceptions.hpp"

namespace starjudge {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout) throw internal_error("unable to open", path);
    fout.write(content.data(), content.size());
    fout.close();
    if (!fout) throw internal_error("unable to write", path);
}

string utf8_truncate(const string &string, size_t limit) {
    if (string.size() <= limit) return string;
    size_t end = limit;
    // 回退到字符边界：10bbbbbb 是多字节字符的后续字节
    while (end > 0 && ((unsigned char)string[end] & 0xC0) == 0x80)
        --end;
    return string.substr(0, end);
}

}  // namespace starjudge
