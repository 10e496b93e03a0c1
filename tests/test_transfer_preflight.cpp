/**
 * Destination checks run by the worker before any network activity.
 */

#define BOOST_TEST_MODULE transfer_preflight
#include <boost/test/unit_test.hpp>

#include "TestSupport.hpp"
#include "mocks/CountingFileSystem.hpp"
#include "mocks/ScriptedFtpClient.hpp"

using namespace ftpget::core::transfer;
using namespace ftpget::test;

namespace {

struct PreflightFixture {
    PreflightFixture()
        : script(std::make_shared<FtpScript>())
        , fileSystem(std::make_shared<CountingFileSystem>()) {
        script->content = "served by the scripted server\n";
        script->announcedSize = script->content.size();
    }

    std::unique_ptr<Transfer> run(const fs::path& localPath, bool overwrite, bool createDir) {
        TransferRequest request;
        request.host = "ftp.example.com";
        request.remotePath = "pub/notes.txt";
        request.localPath = localPath.string();
        request.overwrite = overwrite;
        request.createDir = createDir;

        auto transfer = std::make_unique<Transfer>(
            request, true, TransferDependencies{scriptedFactory(script), fileSystem});
        BOOST_REQUIRE(transfer->waitForCompletion(kWaitTimeout));
        return transfer;
    }

    static void requirePreflightFailure(const Transfer& transfer, const std::string& fragment) {
        BOOST_REQUIRE_EQUAL(transfer.state(), TransferState::Failed);
        auto cause = transfer.failureCause();
        BOOST_REQUIRE(cause);
        BOOST_CHECK_EQUAL(cause->kind, ErrorKind::Preflight);
        BOOST_CHECK_MESSAGE(cause->message.find(fragment) != std::string::npos,
                            "unexpected message: " << cause->message);
    }

    TempDir dir;
    std::shared_ptr<FtpScript> script;
    std::shared_ptr<CountingFileSystem> fileSystem;
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(TransferPreflight, PreflightFixture)

BOOST_AUTO_TEST_CASE(existing_destination_is_kept_without_overwrite) {
    const fs::path localPath = dir / "notes.txt";
    writeFile(localPath, "precious local copy");

    auto transfer = run(localPath, false, true);

    requirePreflightFailure(*transfer, "already exists");
    BOOST_CHECK_EQUAL(readFile(localPath), "precious local copy");
    BOOST_CHECK_EQUAL(script->clientsCreated, 0);
    BOOST_CHECK_EQUAL(fileSystem->filesOpened(), 0);
    BOOST_CHECK_EQUAL(fileSystem->removals(), 0);
}

BOOST_AUTO_TEST_CASE(overwrite_replaces_existing_destination) {
    const fs::path localPath = dir / "notes.txt";
    writeFile(localPath, "an older and considerably longer local copy of the notes");

    auto transfer = run(localPath, true, true);

    BOOST_CHECK_EQUAL(transfer->state(), TransferState::Done);
    BOOST_CHECK_EQUAL(readFile(localPath), script->content);
    BOOST_CHECK_EQUAL(script->lastRemotePath, "pub/notes.txt");
}

BOOST_AUTO_TEST_CASE(missing_directory_fails_when_creation_disabled) {
    const fs::path localPath = dir / "a" / "b" / "notes.txt";

    auto transfer = run(localPath, false, false);

    requirePreflightFailure(*transfer, "does not exist");
    BOOST_CHECK(!fs::exists(dir / "a"));
    BOOST_CHECK_EQUAL(fileSystem->directoriesCreated(), 0);
    BOOST_CHECK_EQUAL(script->clientsCreated, 0);
}

BOOST_AUTO_TEST_CASE(missing_directory_chain_is_created) {
    const fs::path localPath = dir / "a" / "b" / "c" / "notes.txt";

    auto transfer = run(localPath, false, true);

    BOOST_CHECK_EQUAL(transfer->state(), TransferState::Done);
    BOOST_CHECK(fs::is_directory(dir / "a" / "b" / "c"));
    BOOST_CHECK_EQUAL(fileSystem->directoriesCreated(), 1);
    BOOST_CHECK_EQUAL(readFile(localPath), script->content);
}

BOOST_AUTO_TEST_CASE(existing_directory_is_used_as_is) {
    fs::create_directories(dir / "existing");

    auto transfer = run(dir / "existing" / "notes.txt", false, false);

    BOOST_CHECK_EQUAL(transfer->state(), TransferState::Done);
    BOOST_CHECK_EQUAL(fileSystem->directoriesCreated(), 0);
}

BOOST_AUTO_TEST_CASE(parent_that_is_a_file_fails) {
    writeFile(dir / "blocker", "not a directory");

    auto transfer = run(dir / "blocker" / "notes.txt", false, true);

    requirePreflightFailure(*transfer, "not a directory");
    BOOST_CHECK_EQUAL(readFile(dir / "blocker"), "not a directory");
    BOOST_CHECK_EQUAL(script->clientsCreated, 0);
}

BOOST_AUTO_TEST_CASE(failed_preflight_leaves_no_file_behind) {
    auto transfer = run(dir / "missing" / "notes.txt", false, false);

    BOOST_REQUIRE_EQUAL(transfer->state(), TransferState::Failed);
    BOOST_CHECK(!fs::exists(dir / "missing" / "notes.txt"));
    BOOST_CHECK_EQUAL(transfer->bytesRead(), 0u);
    BOOST_CHECK(!transfer->totalBytes());
}

BOOST_AUTO_TEST_SUITE_END()
