#define BOOST_TEST_MODULE transfer_state
#include <boost/test/unit_test.hpp>

#include "core/transfer/TransferError.hpp"
#include "core/transfer/TransferState.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

using namespace ftpget::core::transfer;

namespace {

const std::vector<TransferState> kAllStates = {
    TransferState::Queued,  TransferState::Connecting, TransferState::Running,
    TransferState::Aborting, TransferState::Done,      TransferState::Aborted,
    TransferState::Failed,
};

} // namespace

BOOST_AUTO_TEST_SUITE(TransferStateTest)

BOOST_AUTO_TEST_CASE(abortable_states) {
    BOOST_CHECK(isAbortableState(TransferState::Queued));
    BOOST_CHECK(isAbortableState(TransferState::Connecting));
    BOOST_CHECK(isAbortableState(TransferState::Running));

    BOOST_CHECK(!isAbortableState(TransferState::Aborting));
    BOOST_CHECK(!isAbortableState(TransferState::Done));
    BOOST_CHECK(!isAbortableState(TransferState::Aborted));
    BOOST_CHECK(!isAbortableState(TransferState::Failed));
}

BOOST_AUTO_TEST_CASE(done_states) {
    BOOST_CHECK(isDoneState(TransferState::Done));
    BOOST_CHECK(isDoneState(TransferState::Aborted));
    BOOST_CHECK(isDoneState(TransferState::Failed));

    BOOST_CHECK(!isDoneState(TransferState::Queued));
    BOOST_CHECK(!isDoneState(TransferState::Connecting));
    BOOST_CHECK(!isDoneState(TransferState::Running));
    BOOST_CHECK(!isDoneState(TransferState::Aborting));
}

BOOST_AUTO_TEST_CASE(abortable_and_done_are_disjoint) {
    for (auto state : kAllStates) {
        BOOST_CHECK_MESSAGE(!(isAbortableState(state) && isDoneState(state)), state);
    }
    // Aborting is the only state in neither set
    const auto inNeither = std::count_if(kAllStates.begin(), kAllStates.end(), [](TransferState s) {
        return !isAbortableState(s) && !isDoneState(s);
    });
    BOOST_CHECK_EQUAL(inNeither, 1);
}

BOOST_AUTO_TEST_CASE(names_fit_column_width) {
    std::size_t longest = 0;
    for (auto state : kAllStates) {
        longest = std::max(longest, toString(state).size());
    }
    BOOST_CHECK_EQUAL(longest, kMaxStateNameLength);
    BOOST_CHECK(toString(TransferState::Connecting) == "Connecting");
    BOOST_CHECK(toString(TransferState::Aborting) == "Aborting");
}

BOOST_AUTO_TEST_CASE(streams_name) {
    std::ostringstream out;
    out << TransferState::Running << "/" << TransferState::Failed;
    BOOST_CHECK_EQUAL(out.str(), "Running/Failed");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(TransferErrorTest)

BOOST_AUTO_TEST_CASE(exceptions_carry_their_kind) {
    BOOST_CHECK_EQUAL(ConfigurationError("x").kind(), ErrorKind::Configuration);
    BOOST_CHECK_EQUAL(PreflightError("x").kind(), ErrorKind::Preflight);
    BOOST_CHECK_EQUAL(TransferError("x").kind(), ErrorKind::Transfer);

    BOOST_CHECK_EXCEPTION(throw PreflightError("Destination /tmp/x already exists"),
                          TransferException,
                          [](const TransferException& e) {
                              return std::string(e.what()) == "Destination /tmp/x already exists";
                          });
}

BOOST_AUTO_TEST_CASE(kind_names) {
    BOOST_CHECK(toString(ErrorKind::Configuration) == "ConfigurationError");
    BOOST_CHECK(toString(ErrorKind::Preflight) == "PreflightError");
    BOOST_CHECK(toString(ErrorKind::Transfer) == "TransferError");

    std::ostringstream out;
    out << FailureCause{ErrorKind::Transfer, "550 No such file"};
    BOOST_CHECK_EQUAL(out.str(), "TransferError: 550 No such file");
}

BOOST_AUTO_TEST_CASE(failure_cause_equality) {
    const FailureCause a{ErrorKind::Transfer, "550 No such file"};
    BOOST_CHECK(a == (FailureCause{ErrorKind::Transfer, "550 No such file"}));
    BOOST_CHECK(a != (FailureCause{ErrorKind::Preflight, "550 No such file"}));
    BOOST_CHECK(a != (FailureCause{ErrorKind::Transfer, "other"}));
}

BOOST_AUTO_TEST_SUITE_END()
