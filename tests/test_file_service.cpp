#include <pathjail/sandbox/file_service.hpp>
#include <pathjail/sandbox/paths.hpp>
#include "test_helpers.hpp"

#include <memory>
#include <thread>
#include <vector>

using namespace pathjail;
using pathjail::test::ScratchDirTest;

class FileServiceTest : public ScratchDirTest {
protected:
    void SetUp() override {
        ScratchDirTest::SetUp();
        open_with(SandboxOptions());
    }

    void open_with(const SandboxOptions& options) {
        Result<std::unique_ptr<FileService>> r = open_sandbox(root_, options);
        ASSERT_TRUE(r.success) << r.error.describe();
        fs = std::move(r.value);
    }

    std::vector<std::string> outside_names() const {
        std::vector<std::string> names;
        Result<std::unique_ptr<FileService>> r = open_sandbox(outside_, SandboxOptions());
        EXPECT_TRUE(r.success);
        if (r.success) {
            Result<std::vector<std::string>> l = r.value->list_directory(".");
            EXPECT_TRUE(l.success);
            names = l.value;
        }
        return names;
    }

    std::unique_ptr<FileService> fs;
};

// ---------------------------------------------------------------------------
// read / write
// ---------------------------------------------------------------------------

TEST_F(FileServiceTest, NestedWriteThenRead) {
    make_dir("a");
    make_dir("a/b");
    ASSERT_TRUE(fs->write_file("a/b/c.txt", "nested").success);

    Result<std::string> r = fs->read_file("a/b/c.txt");
    ASSERT_TRUE(r.success) << r.error.describe();
    EXPECT_EQ(r.value, "nested");
    EXPECT_EQ(read_host(in_root("a/b/c.txt")), "nested");
}

TEST_F(FileServiceTest, WriteAcceptsEquivalentSpellings) {
    make_dir("a");
    ASSERT_TRUE(fs->write_file("a\\x.txt", "one").success);
    EXPECT_EQ(fs->read_file("a/./x.txt").value, "one");
    EXPECT_EQ(fs->read_file("a/../a/x.txt").value, "one");
    EXPECT_EQ(fs->read_file("%61/x.txt").value, "one");
}

TEST_F(FileServiceTest, WriteReplacesAtomicallyAndKeepsMode) {
    make_file("f.txt", "old contents");
    ASSERT_EQ(chmod(in_root("f.txt").c_str(), 0600), 0);

    ASSERT_TRUE(fs->write_file("f.txt", "new").success);
    EXPECT_EQ(read_host(in_root("f.txt")), "new");

    struct stat st;
    ASSERT_EQ(stat(in_root("f.txt").c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 07777, 0600u);

    // No temporary files are left behind
    Result<std::vector<std::string>> names = fs->list_directory(".");
    ASSERT_TRUE(names.success);
    ASSERT_EQ(names.value.size(), 1u);
    EXPECT_EQ(names.value[0], "f.txt");
}

TEST_F(FileServiceTest, WriteDropsSpecialModeBits) {
    make_file("tool.sh", "#!/bin/sh\n");
    ASSERT_EQ(chmod(in_root("tool.sh").c_str(), 04755 | S_ISVTX), 0);

    ASSERT_TRUE(fs->write_file("tool.sh", "echo replaced\n").success);

    struct stat st;
    ASSERT_EQ(stat(in_root("tool.sh").c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 07777, 0755u);
}

TEST_F(FileServiceTest, WriteBinaryAndEmpty) {
    std::string data("\x00\x01\xFF\xFE", 4);
    ASSERT_TRUE(fs->write_file("bin", data).success);
    EXPECT_EQ(fs->read_file("bin").value, data);

    ASSERT_TRUE(fs->write_file("empty", "").success);
    Result<std::string> r = fs->read_file("empty");
    ASSERT_TRUE(r.success);
    EXPECT_TRUE(r.value.empty());
}

TEST_F(FileServiceTest, WriteNeedsExistingParent) {
    EXPECT_EQ(fs->write_file("missing/f.txt", "x").error.kind, ErrorKind::NotFound);
    EXPECT_FALSE(host_exists(in_root("missing")));
}

TEST_F(FileServiceTest, WriteOntoDirectoryOrRootFails) {
    make_dir("d");
    EXPECT_EQ(fs->write_file("d", "x").error.kind, ErrorKind::IoError);
    EXPECT_EQ(fs->write_file(".", "x").error.kind, ErrorKind::IoError);
}

TEST_F(FileServiceTest, WriteThroughFileParentIsNotFound) {
    make_file("f.txt", "x");
    EXPECT_EQ(fs->write_file("f.txt/child", "x").error.kind, ErrorKind::NotFound);
}

TEST_F(FileServiceTest, ReadFailures) {
    make_dir("d");
    EXPECT_EQ(fs->read_file("nope.txt").error.kind, ErrorKind::NotFound);
    EXPECT_EQ(fs->read_file("nope/x.txt").error.kind, ErrorKind::NotFound);
    EXPECT_EQ(fs->read_file("d").error.kind, ErrorKind::IoError);
    EXPECT_EQ(fs->read_file(".").error.kind, ErrorKind::IoError);
}

TEST_F(FileServiceTest, ReadRespectsSizeLimit) {
    SandboxOptions options;
    options.max_read_bytes = 4;
    open_with(options);

    make_file("small", "1234");
    make_file("large", "12345");
    EXPECT_TRUE(fs->read_file("small").success);
    EXPECT_EQ(fs->read_file("large").error.kind, ErrorKind::IoError);
}

// ---------------------------------------------------------------------------
// Sandbox enforcement
// ---------------------------------------------------------------------------

TEST_F(FileServiceTest, TraversalAndAbsoluteInputsNeverTouchOutside) {
    const char* hostile[] = {
        "../outside.txt",
        "..\\outside.txt",
        "%2e%2e/outside.txt",
        "../outside/outside.txt",
        "/etc/passwd",
        "C:\\Windows\\system32\\config.sys",
        "\\\\server\\share\\file.txt",
        "file:///etc/passwd",
        "~/outside.txt",
    };
    for (const char* raw : hostile) {
        Result<std::string> r = fs->read_file(raw);
        ASSERT_FALSE(r.success) << raw;
        EXPECT_TRUE(is_security_violation(r.error.kind)) << raw;
        EXPECT_EQ(r.error.public_message(), "access denied");

        Status w = fs->write_file(raw, "pwned");
        ASSERT_FALSE(w.success) << raw;
        EXPECT_TRUE(is_security_violation(w.error.kind)) << raw;

        EXPECT_TRUE(is_security_violation(fs->delete_file(raw).error.kind)) << raw;
        EXPECT_TRUE(is_security_violation(fs->create_directory(raw).error.kind)) << raw;
        EXPECT_TRUE(is_security_violation(fs->exists(raw).error.kind)) << raw;
    }

    EXPECT_EQ(read_host(outside_ + "/outside.txt"), "secret");
    EXPECT_EQ(outside_names(), std::vector<std::string>{"outside.txt"});
}

TEST_F(FileServiceTest, SpecificRejectionKinds) {
    EXPECT_EQ(fs->read_file("../outside.txt").error.kind, ErrorKind::TraversalRejected);
    EXPECT_EQ(fs->read_file("/etc/passwd").error.kind, ErrorKind::AbsolutePathRejected);
    EXPECT_EQ(fs->read_file("").error.kind, ErrorKind::InvalidPath);
    EXPECT_EQ(fs->read_file("a\nb").error.kind, ErrorKind::InvalidPath);
}

TEST_F(FileServiceTest, LinksAreRejectedWhereverTheyPoint) {
    make_file("real.txt", "inside");
    make_symlink("real.txt", "inner_link");
    make_symlink(outside_ + "/outside.txt", "outer_link");
    make_symlink(outside_, "outer_dir");

    EXPECT_EQ(fs->read_file("inner_link").error.kind, ErrorKind::SymbolicLinkRejected);
    EXPECT_EQ(fs->read_file("outer_link").error.kind, ErrorKind::SymbolicLinkRejected);
    EXPECT_EQ(fs->read_file("outer_dir/outside.txt").error.kind, ErrorKind::SymbolicLinkRejected);
    EXPECT_EQ(fs->write_file("outer_link", "pwned").error.kind, ErrorKind::SymbolicLinkRejected);
    EXPECT_EQ(fs->write_file("outer_dir/new.txt", "pwned").error.kind,
              ErrorKind::SymbolicLinkRejected);
    EXPECT_EQ(fs->delete_file("outer_link").error.kind, ErrorKind::SymbolicLinkRejected);
    EXPECT_EQ(fs->list_directory("outer_dir").error.kind, ErrorKind::SymbolicLinkRejected);
    EXPECT_EQ(fs->size("outer_link").error.kind, ErrorKind::SymbolicLinkRejected);

    EXPECT_EQ(read_host(outside_ + "/outside.txt"), "secret");
    EXPECT_EQ(outside_names(), std::vector<std::string>{"outside.txt"});
    EXPECT_TRUE(host_exists(in_root("outer_link")));
}

TEST_F(FileServiceTest, HardLinksAndSpecialFilesAreRejected) {
    make_file("orig.txt", "x");
    ASSERT_EQ(link(in_root("orig.txt").c_str(), in_root("twin.txt").c_str()), 0);
    ASSERT_EQ(mkfifo(in_root("pipe").c_str(), 0600), 0);

    EXPECT_EQ(fs->read_file("twin.txt").error.kind, ErrorKind::SymbolicLinkRejected);
    EXPECT_EQ(fs->read_file("pipe").error.kind, ErrorKind::SymbolicLinkRejected);
    EXPECT_EQ(fs->write_file("pipe", "x").error.kind, ErrorKind::SymbolicLinkRejected);
}

TEST_F(FileServiceTest, HardLinksAllowedByPolicy) {
    SandboxOptions options;
    options.reject_hardlinks = false;
    open_with(options);

    make_file("orig.txt", "shared");
    ASSERT_EQ(link(in_root("orig.txt").c_str(), in_root("twin.txt").c_str()), 0);
    EXPECT_EQ(fs->read_file("twin.txt").value, "shared");
}

TEST_F(FileServiceTest, SymlinkCreationIsForbidden) {
    Status s = fs->create_symlink(outside_ + "/outside.txt", "link");
    EXPECT_EQ(s.error.kind, ErrorKind::OperationForbidden);
    EXPECT_EQ(fs->create_symlink("inside.txt", "link").error.kind, ErrorKind::OperationForbidden);
    EXPECT_FALSE(host_exists(in_root("link")));
}

// ---------------------------------------------------------------------------
// Races between validation and I/O
// ---------------------------------------------------------------------------

TEST_F(FileServiceTest, IntermediateDirectorySwappedForLink) {
    make_dir("d");
    make_file("d/file.txt", "inside");
    write_host(outside_ + "/file.txt", "outside");

    int swaps = 0;
    SandboxOptions options;
    options.pre_io_hook = [&](const ResolvedPath& path) {
        if (path.relative.to_string() != "d/file.txt" || swaps > 0) return;
        ++swaps;
        ASSERT_EQ(rename(in_root("d").c_str(), in_root("d.moved").c_str()), 0);
        ASSERT_EQ(symlink(outside_.c_str(), in_root("d").c_str()), 0);
    };
    open_with(options);

    Result<std::string> r = fs->read_file("d/file.txt");
    EXPECT_EQ(swaps, 1);
    ASSERT_FALSE(r.success) << "read through swapped link: " << r.value;
    EXPECT_EQ(r.error.kind, ErrorKind::SymbolicLinkRejected);

    // A later call sees the link during validation
    EXPECT_EQ(fs->write_file("d/file.txt", "pwned").error.kind, ErrorKind::SymbolicLinkRejected);
    EXPECT_EQ(read_host(outside_ + "/file.txt"), "outside");
}

TEST_F(FileServiceTest, WriteRacesIntermediateSwap) {
    make_dir("d");
    int swaps = 0;
    SandboxOptions options;
    options.pre_io_hook = [&](const ResolvedPath&) {
        if (swaps++ > 0) return;
        ASSERT_EQ(rename(in_root("d").c_str(), in_root("d.moved").c_str()), 0);
        ASSERT_EQ(symlink(outside_.c_str(), in_root("d").c_str()), 0);
    };
    open_with(options);

    EXPECT_EQ(fs->write_file("d/planted.txt", "pwned").error.kind,
              ErrorKind::SymbolicLinkRejected);
    EXPECT_FALSE(host_exists(outside_ + "/planted.txt"));
}

TEST_F(FileServiceTest, FinalComponentSwappedForLink) {
    make_file("f.txt", "inside");
    int swaps = 0;
    SandboxOptions options;
    options.pre_io_hook = [&](const ResolvedPath& path) {
        if (path.name() != "f.txt" || swaps > 0) return;
        ++swaps;
        ASSERT_EQ(unlink(in_root("f.txt").c_str()), 0);
        ASSERT_EQ(symlink((outside_ + "/outside.txt").c_str(), in_root("f.txt").c_str()), 0);
    };
    open_with(options);

    EXPECT_EQ(fs->read_file("f.txt").error.kind, ErrorKind::SymbolicLinkRejected);
    EXPECT_EQ(swaps, 1);
    EXPECT_EQ(read_host(outside_ + "/outside.txt"), "secret");
}

TEST_F(FileServiceTest, FinalComponentSwappedBeforeWrite) {
    make_file("f.txt", "inside");
    int swaps = 0;
    SandboxOptions options;
    options.pre_io_hook = [&](const ResolvedPath&) {
        if (swaps++ > 0) return;
        ASSERT_EQ(unlink(in_root("f.txt").c_str()), 0);
        ASSERT_EQ(symlink((outside_ + "/outside.txt").c_str(), in_root("f.txt").c_str()), 0);
    };
    open_with(options);

    EXPECT_EQ(fs->write_file("f.txt", "pwned").error.kind, ErrorKind::SymbolicLinkRejected);
    EXPECT_EQ(read_host(outside_ + "/outside.txt"), "secret");
}

TEST_F(FileServiceTest, DeleteFileRacesFinalSwap) {
    make_file("f.txt", "inside");
    int swaps = 0;
    SandboxOptions options;
    options.pre_io_hook = [&](const ResolvedPath&) {
        if (swaps++ > 0) return;
        ASSERT_EQ(unlink(in_root("f.txt").c_str()), 0);
        ASSERT_EQ(symlink((outside_ + "/outside.txt").c_str(), in_root("f.txt").c_str()), 0);
    };
    open_with(options);

    EXPECT_EQ(fs->delete_file("f.txt").error.kind, ErrorKind::SymbolicLinkRejected);
    EXPECT_EQ(read_host(outside_ + "/outside.txt"), "secret");
}

TEST_F(FileServiceTest, RecursiveDeleteRacesDirectorySwap) {
    ASSERT_EQ(mkdir((outside_ + "/sub").c_str(), 0755), 0);
    write_host(outside_ + "/sub/keep.txt", "keep");
    make_dir("d");
    make_file("d/junk.txt", "x");

    int swaps = 0;
    SandboxOptions options;
    options.pre_io_hook = [&](const ResolvedPath&) {
        if (swaps++ > 0) return;
        ASSERT_EQ(rename(in_root("d").c_str(), in_root("d.moved").c_str()), 0);
        ASSERT_EQ(symlink((outside_ + "/sub").c_str(), in_root("d").c_str()), 0);
    };
    open_with(options);

    EXPECT_EQ(fs->delete_directory("d", true).error.kind, ErrorKind::SymbolicLinkRejected);
    EXPECT_EQ(read_host(outside_ + "/sub/keep.txt"), "keep");
    EXPECT_TRUE(host_exists(in_root("d.moved/junk.txt")));
}

TEST_F(FileServiceTest, ListingRacesDirectorySwap) {
    make_dir("d");
    make_file("d/a.txt", "x");
    int swaps = 0;
    SandboxOptions options;
    options.pre_io_hook = [&](const ResolvedPath& path) {
        if (path.relative.to_string() != "d") return;
        ++swaps;
        ASSERT_EQ(rename(in_root("d").c_str(), in_root("d.moved").c_str()), 0);
        ASSERT_EQ(symlink(outside_.c_str(), in_root("d").c_str()), 0);
    };
    open_with(options);

    EXPECT_EQ(fs->list_directory("d").error.kind, ErrorKind::SymbolicLinkRejected);
    EXPECT_EQ(swaps, 1);

    // Restore the real directory so the next call validates cleanly
    ASSERT_EQ(unlink(in_root("d").c_str()), 0);
    ASSERT_EQ(rename(in_root("d.moved").c_str(), in_root("d").c_str()), 0);
    EXPECT_EQ(fs->list_entries("d").error.kind, ErrorKind::SymbolicLinkRejected);
    EXPECT_EQ(swaps, 2);
}

TEST_F(FileServiceTest, CreateDirectoryRacesParentSwap) {
    make_dir("d");
    int swaps = 0;
    SandboxOptions options;
    options.pre_io_hook = [&](const ResolvedPath&) {
        if (swaps++ > 0) return;
        ASSERT_EQ(rename(in_root("d").c_str(), in_root("d.moved").c_str()), 0);
        ASSERT_EQ(symlink(outside_.c_str(), in_root("d").c_str()), 0);
    };
    open_with(options);

    EXPECT_EQ(fs->create_directory("d/planted").error.kind, ErrorKind::SymbolicLinkRejected);
    EXPECT_FALSE(host_exists(outside_ + "/planted"));
    EXPECT_EQ(outside_names(), std::vector<std::string>{"outside.txt"});
}

// ---------------------------------------------------------------------------
// delete
// ---------------------------------------------------------------------------

TEST_F(FileServiceTest, DeleteFile) {
    make_file("f.txt", "x");
    ASSERT_TRUE(fs->delete_file("f.txt").success);
    EXPECT_FALSE(host_exists(in_root("f.txt")));
    EXPECT_EQ(fs->delete_file("f.txt").error.kind, ErrorKind::NotFound);
}

TEST_F(FileServiceTest, DeleteFileRefusesDirectoriesAndRoot) {
    make_dir("d");
    EXPECT_EQ(fs->delete_file("d").error.kind, ErrorKind::IoError);
    EXPECT_EQ(fs->delete_file(".").error.kind, ErrorKind::OperationForbidden);
    EXPECT_EQ(fs->delete_file("d/..").error.kind, ErrorKind::OperationForbidden);
    EXPECT_TRUE(host_exists(in_root("d")));
}

// ---------------------------------------------------------------------------
// listing
// ---------------------------------------------------------------------------

TEST_F(FileServiceTest, ListingHidesLinksAndSorts) {
    make_file("zeta.txt", "z");
    make_file("alpha.txt", "aa");
    make_dir("mid");
    make_symlink(outside_, "link_dir");
    make_symlink("alpha.txt", "link_file");
    make_symlink("/nonexistent", "link_dangling");

    Result<std::vector<std::string>> names = fs->list_directory(".");
    ASSERT_TRUE(names.success) << names.error.describe();
    std::vector<std::string> expected = {"alpha.txt", "mid", "zeta.txt"};
    EXPECT_EQ(names.value, expected);
}

TEST_F(FileServiceTest, ListEntriesReportsTypesAndSizes) {
    make_dir("sub");
    make_file("sub/a.txt", "12345");
    make_dir("sub/inner");

    Result<std::vector<DirEntry>> r = fs->list_entries("sub");
    ASSERT_TRUE(r.success);
    ASSERT_EQ(r.value.size(), 2u);
    EXPECT_EQ(r.value[0].name, "a.txt");
    EXPECT_FALSE(r.value[0].is_directory);
    EXPECT_EQ(r.value[0].size, 5u);
    EXPECT_EQ(r.value[1].name, "inner");
    EXPECT_TRUE(r.value[1].is_directory);
    EXPECT_EQ(r.value[1].size, 0u);
}

TEST_F(FileServiceTest, ListFailures) {
    make_file("f.txt", "x");
    EXPECT_EQ(fs->list_directory("missing").error.kind, ErrorKind::NotFound);
    EXPECT_EQ(fs->list_directory("f.txt").error.kind, ErrorKind::IoError);
    EXPECT_EQ(fs->list_directory("..").error.kind, ErrorKind::TraversalRejected);
}

TEST_F(FileServiceTest, EmptyRootListsNothing) {
    Result<std::vector<std::string>> names = fs->list_directory(".");
    ASSERT_TRUE(names.success);
    EXPECT_TRUE(names.value.empty());
}

// ---------------------------------------------------------------------------
// directories
// ---------------------------------------------------------------------------

TEST_F(FileServiceTest, CreateDirectory) {
    ASSERT_TRUE(fs->create_directory("new").success);
    EXPECT_TRUE(fs->exists("new").value);
    EXPECT_EQ(fs->create_directory("new").error.kind, ErrorKind::AlreadyExists);
    EXPECT_EQ(fs->create_directory(".").error.kind, ErrorKind::AlreadyExists);
    EXPECT_EQ(fs->create_directory("a/b").error.kind, ErrorKind::NotFound);
    ASSERT_TRUE(fs->create_directory("new/child").success);
}

TEST_F(FileServiceTest, DeleteEmptyDirectory) {
    make_dir("d");
    make_dir("full");
    make_file("full/f.txt", "x");

    ASSERT_TRUE(fs->delete_directory("d", false).success);
    EXPECT_FALSE(host_exists(in_root("d")));
    EXPECT_EQ(fs->delete_directory("full", false).error.kind, ErrorKind::NotEmpty);
    EXPECT_EQ(fs->delete_directory("missing", false).error.kind, ErrorKind::NotFound);
    EXPECT_EQ(fs->delete_directory("full/f.txt", false).error.kind, ErrorKind::IoError);
    EXPECT_EQ(fs->delete_directory(".", true).error.kind, ErrorKind::OperationForbidden);
    EXPECT_TRUE(host_exists(in_root("full/f.txt")));
}

TEST_F(FileServiceTest, RecursiveDeleteRemovesLinksWithoutFollowing) {
    make_dir("tree");
    make_dir("tree/a");
    make_dir("tree/a/b");
    make_file("tree/a/b/deep.txt", "x");
    make_file("tree/top.txt", "y");
    make_symlink(outside_, "tree/a/escape_dir");
    make_symlink(outside_ + "/outside.txt", "tree/escape_file");

    ASSERT_TRUE(fs->delete_directory("tree", true).success);
    EXPECT_FALSE(host_exists(in_root("tree")));
    EXPECT_EQ(read_host(outside_ + "/outside.txt"), "secret");
    EXPECT_EQ(outside_names(), std::vector<std::string>{"outside.txt"});
}

TEST_F(FileServiceTest, DirectoryLinkIsNotADirectory) {
    make_symlink(outside_, "dirlink");
    EXPECT_EQ(fs->delete_directory("dirlink", true).error.kind, ErrorKind::SymbolicLinkRejected);
    EXPECT_TRUE(host_exists(outside_ + "/outside.txt"));
}

// ---------------------------------------------------------------------------
// exists / size
// ---------------------------------------------------------------------------

TEST_F(FileServiceTest, Exists) {
    make_file("f.txt", "x");
    make_dir("d");
    EXPECT_TRUE(fs->exists("f.txt").value);
    EXPECT_TRUE(fs->exists("d").value);
    EXPECT_TRUE(fs->exists(".").value);

    Result<bool> r = fs->exists("missing");
    ASSERT_TRUE(r.success);
    EXPECT_FALSE(r.value);
    r = fs->exists("missing/deeper");
    ASSERT_TRUE(r.success);
    EXPECT_FALSE(r.value);

    EXPECT_EQ(fs->exists("../outside.txt").error.kind, ErrorKind::TraversalRejected);
}

TEST_F(FileServiceTest, Size) {
    make_file("f.txt", "1234567");
    make_dir("d");

    Result<uint64_t> r = fs->size("f.txt");
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.value, 7u);
    EXPECT_EQ(fs->size("d").error.kind, ErrorKind::IoError);
    EXPECT_EQ(fs->size(".").error.kind, ErrorKind::IoError);
    EXPECT_EQ(fs->size("missing").error.kind, ErrorKind::NotFound);
}

// ---------------------------------------------------------------------------
// lifecycle and sharing
// ---------------------------------------------------------------------------

TEST_F(FileServiceTest, OpenSandboxRejectsBadRoots) {
    EXPECT_FALSE(open_sandbox(base_ + "/missing", SandboxOptions()).success);

    ASSERT_EQ(symlink(root_.c_str(), (base_ + "/rootlink").c_str()), 0);
    Result<std::unique_ptr<FileService>> r = open_sandbox(base_ + "/rootlink", SandboxOptions());
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.error.kind, ErrorKind::SymbolicLinkRejected);
}

TEST_F(FileServiceTest, RootPathIsCanonical) {
    const std::string& path = fs->root_path();
    ASSERT_GT(path.size(), 5u);
    EXPECT_EQ(path[0], '/');
    EXPECT_EQ(path.substr(path.size() - 5), "/root");
    EXPECT_EQ(path.find("//"), std::string::npos);
}

TEST_F(FileServiceTest, SharedAcrossThreads) {
    const int kThreads = 8;
    std::vector<std::thread> threads;
    std::vector<int> failures(kThreads, 0);
    for (int t = 0; t < kThreads; ++t) {
        threads.push_back(std::thread([this, t, &failures]() {
            std::string name = "t" + std::to_string(t) + ".txt";
            for (int i = 0; i < 20; ++i) {
                std::string data = name + ":" + std::to_string(i);
                if (!fs->write_file(name, data).success) ++failures[t];
                Result<std::string> r = fs->read_file(name);
                if (!r.success || r.value != data) ++failures[t];
                if (fs->read_file("../outside.txt").success) ++failures[t];
            }
        }));
    }
    for (size_t i = 0; i < threads.size(); ++i) {
        threads[i].join();
    }
    for (int t = 0; t < kThreads; ++t) {
        EXPECT_EQ(failures[t], 0) << "thread " << t;
    }
    EXPECT_EQ(fs->list_directory(".").value.size(), static_cast<size_t>(kThreads));
}
