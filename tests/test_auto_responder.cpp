#include <catch2/catch_test_macros.hpp>

#include "monitor/auto_responder.hpp"
#include "monitor/monitor_session.hpp"
#include "platform/multiplexer.hpp"

#include <string>
#include <utility>
#include <vector>

namespace {

class MockMultiplexer : public Multiplexer {
public:
    std::expected<std::string, std::string> capture(const std::string&) override {
        return std::string{};
    }

    std::expected<void, std::string> send_literal(const std::string& target,
                                                  const std::string& text) override {
        if (fail_sends) return std::unexpected("no server running");
        sent.emplace_back(target, text);
        return {};
    }

    std::expected<std::string, std::string> resolve_pane(const std::string& target) override {
        return target;
    }

    bool fail_sends = false;
    std::vector<std::pair<std::string, std::string>> sent;
};

} // namespace

TEST_CASE("AutoResponder", "[responder]") {
    MockMultiplexer mux;
    AutoResponder responder(mux);
    MonitorSession session("%7", MonitorSession::Clock::time_point{}, std::chrono::seconds(60));

    AwaitingPermission menu{
        .prompt = "Do you want to proceed?",
        .context = "rm -rf build\nDo you want to proceed?\n❯ 1. Yes\n2. No",
        .response = "1",
        .submit = false,
    };

    SECTION("SendsResponseOnce") {
        auto first = responder.respond(session, menu);
        REQUIRE(first.has_value());
        REQUIRE(*first);

        for (int i = 0; i < 10; ++i) {
            auto again = responder.respond(session, menu);
            REQUIRE(again.has_value());
            REQUIRE_FALSE(*again);
        }

        REQUIRE(mux.sent.size() == 1);
        REQUIRE(mux.sent[0].first == "%7");
        REQUIRE(mux.sent[0].second == "1");
        REQUIRE(session.injections() == 1);
    }

    SECTION("SubmitAppendsEnter") {
        AwaitingPermission yes_no{.prompt = "Continue? [y/n]", .context = {}, .response = "y", .submit = true};
        REQUIRE(responder.respond(session, yes_no).value());
        REQUIRE(mux.sent.back().second == "y\r");
    }

    SECTION("FailedSendIsRetried") {
        mux.fail_sends = true;
        auto res = responder.respond(session, menu);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == "no server running");
        REQUIRE_FALSE(session.answered(AutoResponder::fingerprint(menu)));
        REQUIRE(session.injections() == 0);

        mux.fail_sends = false;
        REQUIRE(responder.respond(session, menu).value());
        REQUIRE(mux.sent.size() == 1);
    }

    SECTION("DifferentCommandIsANewPrompt") {
        auto other = menu;
        other.context = "git push --force\nDo you want to proceed?\n❯ 1. Yes\n2. No";

        REQUIRE(responder.respond(session, menu).value());
        REQUIRE(responder.respond(session, other).value());
        REQUIRE(mux.sent.size() == 2);
    }

    SECTION("FingerprintIgnoresWhitespaceLayout") {
        auto reflowed = menu;
        reflowed.context = "rm -rf build\n  Do you want to   proceed?\n❯ 1. Yes\n\n2. No  ";
        REQUIRE(AutoResponder::fingerprint(menu) == AutoResponder::fingerprint(reflowed));
    }

    SECTION("FingerprintFallsBackToPrompt") {
        AwaitingPermission a{.prompt = "Allow access?", .context = {}, .response = "y", .submit = true};
        AwaitingPermission b{.prompt = "Allow network?", .context = {}, .response = "y", .submit = true};
        REQUIRE(AutoResponder::fingerprint(a) != AutoResponder::fingerprint(b));
    }
}
