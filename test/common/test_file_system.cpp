#include "catch2/catch.hpp"
#include "extsort/common/exception.hpp"
#include "extsort/common/file_system.hpp"
#include "extsort/common/string_util.hpp"
#include "extsort/storage/temporary_directory_handle.hpp"
#include "test_helpers.hpp"

#include <cstring>
#include <unistd.h>

using namespace extsort;
using namespace std;

static void CreateDummyFile(FileSystem &fs, const string &path) {
	auto handle = fs.OpenFile(path, FileFlags::FILE_FLAGS_WRITE | FileFlags::FILE_FLAGS_FILE_CREATE_NEW);
	char contents[] = "I_AM_A_DUMMY";
	handle->Write(contents, strlen(contents));
	handle->Close();
}

TEST_CASE("Make sure file system operators work as advertised", "[file_system]") {
	auto fs = FileSystem::CreateLocal();
	auto dname = TestCreatePath("TEST_DIR");
	string fname = "TEST_FILE";
	string fname2 = "TEST_FILE_TWO";

	if (fs->DirectoryExists(dname)) {
		fs->RemoveDirectory(dname);
	}

	fs->CreateDirectory(dname);
	REQUIRE(fs->DirectoryExists(dname));
	REQUIRE(!fs->FileExists(dname));

	// we can call this again and nothing happens
	fs->CreateDirectory(dname);

	auto fname_in_dir = fs->JoinPath(dname, fname);
	auto fname_in_dir2 = fs->JoinPath(dname, fname2);

	CreateDummyFile(*fs, fname_in_dir);
	REQUIRE(fs->FileExists(fname_in_dir));
	REQUIRE(!fs->DirectoryExists(fname_in_dir));
	REQUIRE(!fs->FileExists(fname_in_dir2));

	size_t n_files = 0;
	REQUIRE(fs->ListFiles(dname, [&n_files](const string &path, bool) { n_files++; }));
	REQUIRE(n_files == 1);

	fs->RemoveFile(fname_in_dir);
	REQUIRE(!fs->FileExists(fname_in_dir));

	CreateDummyFile(*fs, fname_in_dir2);
	fs->RemoveDirectory(dname);

	REQUIRE(!fs->DirectoryExists(dname));
	REQUIRE(!fs->FileExists(fname_in_dir2));
}

TEST_CASE("Listing a missing directory returns false", "[file_system]") {
	auto fs = FileSystem::CreateLocal();
	auto dname = TestCreatePath("NOT_A_DIR");
	REQUIRE(!fs->ListFiles(dname, [](const string &, bool) {}));
}

TEST_CASE("JoinPath inserts a single separator", "[file_system]") {
	auto fs = FileSystem::CreateLocal();
	REQUIRE(fs->JoinPath("dir", "file") == "dir/file");
	REQUIRE(fs->JoinPath("dir/", "file") == "dir/file");
	REQUIRE(fs->JoinPath("", "file") == "file");
}

TEST_CASE("File handles read back what was written", "[file_system]") {
	auto fs = FileSystem::CreateLocal();
	auto fname = TestCreatePath("read_write_file");
	TestDeleteFile(fname);

	{
		auto handle = fs->OpenFile(fname, FileFlags::FILE_FLAGS_WRITE | FileFlags::FILE_FLAGS_FILE_CREATE);
		int64_t values[] = {1, 2, 3, 4};
		handle->Write(values, sizeof(values));
		REQUIRE(handle->GetFileSize() == sizeof(values));
	}
	auto handle = fs->OpenFile(fname, FileFlags::FILE_FLAGS_READ);
	int64_t value = 0;
	REQUIRE(handle->Read(&value, sizeof(value)) == sizeof(value));
	REQUIRE(value == 1);
	int64_t rest[3];
	REQUIRE(handle->Read(rest, sizeof(rest)) == sizeof(rest));
	REQUIRE(rest[2] == 4);
	// the end of the file reads zero bytes
	REQUIRE(handle->Read(&value, sizeof(value)) == 0);
	handle.reset();
	TestDeleteFile(fname);
}

TEST_CASE("Opening a missing file", "[file_system]") {
	auto fs = FileSystem::CreateLocal();
	auto fname = TestCreatePath("this_file_does_not_exist");
	TestDeleteFile(fname);

	SECTION("throws an IOException that carries errno") {
		bool thrown = false;
		try {
			fs->OpenFile(fname, FileFlags::FILE_FLAGS_READ);
		} catch (IOException &ex) {
			thrown = true;
			REQUIRE(ex.GetType() == ExceptionType::IO);
			REQUIRE(ex.ExtraInfo().count("errno") == 1);
			REQUIRE(StringUtil::Contains(ex.what(), "IO Error: Cannot open file"));
		}
		REQUIRE(thrown);
	}
	SECTION("returns nullptr when asked to") {
		auto handle = fs->OpenFile(fname, FileFlags::FILE_FLAGS_READ | FileFlags::FILE_FLAGS_NULL_IF_NOT_EXISTS);
		REQUIRE(!handle);
	}
}

TEST_CASE("Invalid open flags are rejected", "[file_system]") {
	auto fs = FileSystem::CreateLocal();
	auto fname = TestCreatePath("invalid_flags");
	REQUIRE_THROWS_AS(fs->OpenFile(fname, FileFlags::FILE_FLAGS_FILE_CREATE), InvalidInputException);
	REQUIRE_THROWS_AS(fs->OpenFile(fname, FileFlags::FILE_FLAGS_READ | FileFlags::FILE_FLAGS_FILE_CREATE_NEW),
	                  InvalidInputException);
	REQUIRE_THROWS_AS(fs->OpenFile(fname, FileFlags::FILE_FLAGS_WRITE | FileFlags::FILE_FLAGS_FILE_CREATE |
	                                          FileFlags::FILE_FLAGS_FILE_CREATE_NEW),
	                  InvalidInputException);
}

TEST_CASE("Temporary directories are unique and removed with their contents", "[file_system]") {
	auto fs = FileSystem::CreateLocal();
	auto prefix = StringUtil::Format("extsort_fs_test_%d_", static_cast<int64_t>(getpid()));

	string first_path;
	{
		auto first = TemporaryDirectoryHandle::Create(*fs, prefix);
		auto second = TemporaryDirectoryHandle::Create(*fs, prefix);
		first_path = first->GetPath();
		REQUIRE(first_path != second->GetPath());
		REQUIRE(StringUtil::StartsWith(first_path, fs->JoinPath(fs->GetTempDirectory(), prefix)));
		REQUIRE(fs->DirectoryExists(first_path));
		REQUIRE(TestListTemporaryDirectories(prefix).size() == 2);

		CreateDummyFile(*fs, fs->JoinPath(first_path, "0"));
		CreateDummyFile(*fs, fs->JoinPath(first_path, "1"));
	}
	REQUIRE(!fs->DirectoryExists(first_path));
	REQUIRE(TestListTemporaryDirectories(prefix).empty());
}
