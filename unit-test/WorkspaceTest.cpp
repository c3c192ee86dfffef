#include "gtest/gtest.h"
#include "starjudge/common/exceptions.hpp"
#include "starjudge/common/io_utils.hpp"
#include "starjudge/workspace.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace starjudge;
namespace fs = std::filesystem;

class WorkspaceTest : public ::testing::Test {
protected:
    void SetUp() override {
        work_dir = test::make_temp_directory("workspace");
    }

    void TearDown() override {
        fs::remove_all(work_dir);
    }

    fs::path work_dir;
};

TEST_F(WorkspaceTest, SourceFileLayoutTest) {
    auto cpp = create_workspace(work_dir, language::CPP, "int main() {}");
    EXPECT_EQ(cpp->source_path.filename(), "main.cpp");
    EXPECT_EQ(cpp->executable_path.filename(), "main");
    EXPECT_EQ(read_file_content(cpp->source_path), "int main() {}");

    auto python = create_workspace(work_dir, language::PYTHON, "print(1)");
    EXPECT_EQ(python->source_path.filename(), "main.py");
    EXPECT_EQ(python->executable_path, python->source_path);

    auto java = create_workspace(work_dir, language::JAVA, "public class Main {}");
    EXPECT_EQ(java->source_path.filename(), "Main.java");
    EXPECT_EQ(java->executable_path.filename(), "Main.class");
}

TEST_F(WorkspaceTest, UniqueDirectoryTest) {
    auto a = create_workspace(work_dir, language::CPP, "");
    auto b = create_workspace(work_dir, language::CPP, "");
    EXPECT_NE(a->root, b->root);
    EXPECT_EQ(a->root.parent_path(), work_dir);
    EXPECT_TRUE(fs::is_directory(a->root));
}

TEST_F(WorkspaceTest, ReleaseOnDestructionTest) {
    fs::path root;
    {
        auto ws = create_workspace(work_dir, language::CPP, "int main() {}");
        root = ws->root;
        write_file_content(ws->root / "main", "binary");
        EXPECT_TRUE(fs::exists(root));
    }
    EXPECT_FALSE(fs::exists(root));
}

TEST_F(WorkspaceTest, ReleaseTwiceTest) {
    auto ws = create_workspace(work_dir, language::PYTHON, "");
    ws->release();
    EXPECT_FALSE(fs::exists(ws->root));
    ws->release();
}

TEST_F(WorkspaceTest, KeepTest) {
    fs::path root;
    {
        auto ws = create_workspace(work_dir, language::PYTHON, "");
        root = ws->root;
        ws->keep();
    }
    EXPECT_TRUE(fs::exists(root));
}

TEST_F(WorkspaceTest, CreatesWorkDirectoryTest) {
    auto ws = create_workspace(work_dir / "nested" / "dir", language::CPP, "");
    EXPECT_TRUE(fs::is_regular_file(ws->source_path));
}

TEST_F(WorkspaceTest, UnwritableWorkDirectoryTest) {
    // 工作目录的父路径是普通文件，无法创建目录
    write_file_content(work_dir / "file", "");
    EXPECT_THROW(create_workspace(work_dir / "file", language::CPP, ""), internal_error);
}

TEST_F(WorkspaceTest, ErrorCarriesPathTest) {
    write_file_content(work_dir / "file", "");
    try {
        create_workspace(work_dir / "file" / "sub", language::PYTHON, "");
        FAIL() << "creating a workspace under a regular file should fail";
    } catch (internal_error &ex) {
        EXPECT_EQ(ex.get_path(), work_dir / "file" / "sub");
        EXPECT_NE(string(ex.what()).find("unable to create work directory"), string::npos);
    }
}
