#include "starjudge/workspace.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <system_error>
#include "starjudge/common/exceptions.hpp"
#include "starjudge/common/io_utils.hpp"

namespace starjudge {
using namespace std;
namespace fs = std::filesystem;

workspace::workspace(const fs::path &root, const language_profile &profile)
    : root(root),
      source_path(root / profile.source_file),
      executable_path(profile.compiled() ? root / profile.artifact_file : source_path),
      profile(profile) {}

workspace::~workspace() {
    release();
}

void workspace::release() {
    if (released) return;
    released = true;
    error_code ec;
    fs::remove_all(root, ec);
    if (ec) LOG(WARNING) << "Unable to remove workspace " << root << ": " << ec.message();
}

void workspace::keep() {
    if (!released) LOG(INFO) << "Keeping workspace " << root;
    released = true;
}

unique_ptr<workspace> create_workspace(const fs::path &work_dir, language lang, const string &code) {
    // boost::uuids::random_generator 不是线程安全的，每次调用单独构造
    string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());
    fs::path root = work_dir / ("run-" + uuid);

    error_code ec;
    fs::create_directories(work_dir, ec);
    if (ec) throw internal_error("unable to create work directory", work_dir, ec);
    if (!fs::create_directory(root, ec) || ec)
        throw internal_error("unable to create workspace", root, ec);

    auto ws = make_unique<workspace>(root, get_language_profile(lang));
    write_file_content(ws->source_path, code);
    return ws;
}

}  // namespace starjudge
