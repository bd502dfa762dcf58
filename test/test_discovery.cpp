#include "fakes.hpp"
#include <atomic>
#include <doctest/doctest.h>
#include <memory>
#include <printprobe/discovery.hpp>
#include <thread>

namespace {

    printprobe::DiscoveryConfig config_in(const std::string &dir) {
        printprobe::DiscoveryConfig config;
        config.cache_dir = dp::String(dir.c_str());
        return config;
    }

    struct Recorder {
        std::vector<printprobe::ProbeOutcome> outcomes;
        printprobe::AddHandler handler() {
            return [this](const printprobe::ProbeOutcome &o) { outcomes.push_back(o); };
        }
    };

} // namespace

TEST_CASE("ManualDiscovery - adding") {
    std::string dir = fakes::make_temp_dir();
    fakes::FakeLookup lookup;
    fakes::RecordingListener listener;
    Recorder recorder;

    SUBCASE("Supported printer is added at the front") {
        lookup.answers["ipp://printer.local:631/ipp/printer"] = fakes::supported_at("printer.local:631/ipp/printer");
        printprobe::ManualDiscovery discovery(config_in(dir), lookup, listener);
        discovery.add_manual_endpoint("printer.local", recorder.handler());

        REQUIRE(recorder.outcomes.size() == 1);
        CHECK(recorder.outcomes[0].supported());
        CHECK(recorder.outcomes[0].endpoint->uri.to_string() == "ipp://printer.local:631/ipp/printer");
        REQUIRE(discovery.endpoints().size() == 1);
        CHECK(discovery.endpoints()[0].uri.to_string() == "ipp://printer.local:631/ipp/printer");
        CHECK(discovery.pending_probes() == 0);
    }

    SUBCASE("Nothing answers: not found, registry unchanged") {
        printprobe::ManualDiscovery discovery(config_in(dir), lookup, listener);
        discovery.add_manual_endpoint("printer.local", recorder.handler());

        REQUIRE(recorder.outcomes.size() == 1);
        CHECK(recorder.outcomes[0].status == printprobe::ProbeStatus::NotFound);
        CHECK(lookup.requested.size() == 4);
        CHECK(discovery.endpoints().empty());
    }

    SUBCASE("Unsupported printer is reported but not kept") {
        lookup.answers["ipp://printer.local:631/ipp/printer"] = fakes::unsupported_at("printer.local:631/ipp/printer");
        printprobe::ManualDiscovery discovery(config_in(dir), lookup, listener);
        discovery.add_manual_endpoint("printer.local", recorder.handler());

        REQUIRE(recorder.outcomes.size() == 1);
        CHECK(recorder.outcomes[0].status == printprobe::ProbeStatus::Unsupported);
        CHECK(discovery.endpoints().empty());
    }

    SUBCASE("Invalid hostname reports not found without probing") {
        printprobe::ManualDiscovery discovery(config_in(dir), lookup, listener);
        auto id = discovery.add_manual_endpoint("not a host", recorder.handler());

        CHECK(id == 0);
        REQUIRE(recorder.outcomes.size() == 1);
        CHECK(recorder.outcomes[0].status == printprobe::ProbeStatus::NotFound);
        CHECK(lookup.requested.empty());
    }

    SUBCASE("Adding while announcing notifies the listener") {
        lookup.answers["ipp://printer.local:631/ipp/printer"] = fakes::supported_at("printer.local:631/ipp/printer");
        printprobe::ManualDiscovery discovery(config_in(dir), lookup, listener);
        discovery.start();
        discovery.add_manual_endpoint("printer.local", recorder.handler());

        REQUIRE(listener.found.size() == 1);
        CHECK(listener.found[0] == "ipp://printer.local:631/ipp/printer");
    }

    SUBCASE("Re-adding the same printer keeps one entry") {
        lookup.answers["ipp://printer.local:631/ipp/printer"] = fakes::supported_at("printer.local:631/ipp/printer");
        printprobe::ManualDiscovery discovery(config_in(dir), lookup, listener);
        discovery.start();
        discovery.add_manual_endpoint("printer.local", recorder.handler());
        discovery.add_manual_endpoint("PRINTER.local", recorder.handler());

        CHECK(recorder.outcomes.size() == 2);
        CHECK(discovery.endpoints().size() == 1);
        REQUIRE(listener.events.size() == 3);
        CHECK(listener.events[1] == "-ipp://printer.local:631/ipp/printer");
    }

    SUBCASE("Custom candidate paths and port") {
        auto config = config_in(dir);
        config.candidate_paths = {"printers/lobby"};
        config.default_port = 8631;
        lookup.answers["ipp://printer.local:8631/printers/lobby"] = fakes::supported_at("printer.local/printers/lobby");
        printprobe::ManualDiscovery discovery(config, lookup, listener);
        discovery.add_manual_endpoint("printer.local", recorder.handler());

        REQUIRE(recorder.outcomes.size() == 1);
        CHECK(recorder.outcomes[0].endpoint->uri.to_string() == "ipp://printer.local:8631/printers/lobby");
    }
}

TEST_CASE("ManualDiscovery - announcing") {
    std::string dir = fakes::make_temp_dir();
    fakes::FakeLookup lookup;
    fakes::RecordingListener listener;

    {
        printprobe::ManualDiscovery seed(config_in(dir), lookup, listener);
        lookup.answers["ipp://a.local:631/ipp/printer"] = fakes::supported_at("ipp://a.local:631/ipp/printer");
        lookup.answers["ipp://b.local:631/ipp/printer"] = fakes::supported_at("ipp://b.local:631/ipp/printer");
        seed.add_manual_endpoint("a.local", nullptr);
        seed.add_manual_endpoint("b.local", nullptr);
    }
    listener.clear();

    SUBCASE("Start reports stored endpoints and evicts their cached state") {
        printprobe::ManualDiscovery discovery(config_in(dir), lookup, listener);
        CHECK(listener.events.empty());
        discovery.start();
        CHECK(discovery.is_started());

        REQUIRE(listener.found.size() == 2);
        CHECK(listener.found[0] == "ipp://b.local:631/ipp/printer");
        CHECK(listener.found[1] == "ipp://a.local:631/ipp/printer");
        REQUIRE(lookup.evicted.size() == 2);
        CHECK(lookup.evicted[0] == "ipp://b.local:631/ipp/printer");
    }

    SUBCASE("Stop silences notifications") {
        printprobe::ManualDiscovery discovery(config_in(dir), lookup, listener);
        discovery.start();
        discovery.stop();
        listener.clear();

        discovery.remove_manual_endpoint(fakes::endpoint_at("ipp://a.local:631/ipp/printer"));
        CHECK(listener.events.empty());
        CHECK(discovery.endpoints().size() == 1);
        CHECK_FALSE(discovery.is_started());
    }

    SUBCASE("Second start without stop is ignored") {
        printprobe::ManualDiscovery discovery(config_in(dir), lookup, listener);
        discovery.start();
        discovery.start();
        CHECK(listener.found.size() == 2);
    }

    SUBCASE("Restart announces again") {
        printprobe::ManualDiscovery discovery(config_in(dir), lookup, listener);
        discovery.start();
        discovery.stop();
        discovery.start();
        CHECK(listener.found.size() == 4);
        CHECK(lookup.evicted.size() == 4);
    }

    SUBCASE("Remove while announcing signals lost") {
        printprobe::ManualDiscovery discovery(config_in(dir), lookup, listener);
        discovery.start();
        CHECK(discovery.remove_manual_endpoint(fakes::endpoint_at("ipp://a.local:631/ipp/printer")));
        REQUIRE(listener.lost.size() == 1);
        CHECK(listener.lost[0] == "ipp://a.local:631/ipp/printer");
    }
}

TEST_CASE("ManualDiscovery - persistence across restarts") {
    std::string dir = fakes::make_temp_dir();
    fakes::FakeLookup lookup;
    fakes::RecordingListener listener;
    lookup.answers["ipp://a.local:631/ipp/printer"] = fakes::supported_at("ipp://a.local:631/ipp/printer");
    lookup.answers["ipp://b.local:631/ipp/print"] = fakes::supported_at("ipp://b.local:631/ipp/print");

    SUBCASE("Close saves, next session loads in the same order") {
        {
            printprobe::ManualDiscovery discovery(config_in(dir), lookup, listener);
            discovery.add_manual_endpoint("a.local", nullptr);
            discovery.add_manual_endpoint("b.local", nullptr);
            REQUIRE(discovery.close().is_ok());
            CHECK(discovery.is_closed());
        }

        printprobe::ManualDiscovery next(config_in(dir), lookup, listener);
        auto endpoints = next.endpoints();
        REQUIRE(endpoints.size() == 2);
        CHECK(endpoints[0].uri.to_string() == "ipp://b.local:631/ipp/print");
        CHECK(endpoints[1].uri.to_string() == "ipp://a.local:631/ipp/printer");
    }

    SUBCASE("Removal is persisted") {
        {
            printprobe::ManualDiscovery discovery(config_in(dir), lookup, listener);
            discovery.add_manual_endpoint("a.local", nullptr);
            discovery.add_manual_endpoint("b.local", nullptr);
            discovery.remove_manual_endpoint(fakes::endpoint_at("ipp://b.local:631/ipp/print"));
        }

        printprobe::ManualDiscovery next(config_in(dir), lookup, listener);
        REQUIRE(next.endpoints().size() == 1);
        CHECK(next.endpoints()[0].uri.host == "a.local");
    }

    SUBCASE("save_on_close=false leaves the store alone") {
        auto config = config_in(dir);
        config.save_on_close = false;
        {
            printprobe::ManualDiscovery discovery(config, lookup, listener);
            discovery.add_manual_endpoint("a.local", nullptr);
        }
        printprobe::ManualDiscovery next(config_in(dir), lookup, listener);
        CHECK(next.endpoints().empty());
    }

    SUBCASE("Unwritable cache dir does not break the session") {
        auto config = config_in(dir + "/does/not/exist");
        printprobe::ManualDiscovery discovery(config, lookup, listener);
        discovery.add_manual_endpoint("a.local", nullptr);
        CHECK(discovery.save().is_err());
        CHECK(discovery.endpoints().size() == 1);
        CHECK(discovery.close().is_err());
        CHECK(discovery.close().is_ok());
    }

    SUBCASE("Corrupt store starts empty") {
        REQUIRE(fakes::write_text(dir + "/manual_printers.json", "{\"manualPrinters\": 7"));
        printprobe::ManualDiscovery discovery(config_in(dir), lookup, listener);
        CHECK(discovery.endpoints().empty());
    }
}

TEST_CASE("ManualDiscovery - probe lifetime") {
    std::string dir = fakes::make_temp_dir();
    fakes::FakeLookup lookup;
    fakes::RecordingListener listener;
    Recorder recorder;
    lookup.deferred = true;
    lookup.answers["ipp://printer.local:631/ipp/print"] = fakes::supported_at("ipp://printer.local:631/ipp/print");

    SUBCASE("Outstanding probe completes through later replies") {
        printprobe::ManualDiscovery discovery(config_in(dir), lookup, listener);
        auto id = discovery.add_manual_endpoint("printer.local", recorder.handler());
        CHECK(id != 0);
        CHECK(discovery.pending_probes() == 1);
        CHECK(recorder.outcomes.empty());

        while (lookup.reply_next()) {
        }
        REQUIRE(recorder.outcomes.size() == 1);
        CHECK(recorder.outcomes[0].supported());
        CHECK(discovery.pending_probes() == 0);
    }

    SUBCASE("Cancelled probe never reports") {
        printprobe::ManualDiscovery discovery(config_in(dir), lookup, listener);
        auto id = discovery.add_manual_endpoint("printer.local", recorder.handler());
        CHECK(discovery.cancel(id));
        CHECK_FALSE(discovery.cancel(id));
        while (lookup.reply_next()) {
        }
        CHECK(recorder.outcomes.empty());
        CHECK(discovery.endpoints().empty());
        CHECK(discovery.metrics().cancelled.load() == 1);
    }

    SUBCASE("Responses after the session is gone are dropped") {
        {
            printprobe::ManualDiscovery discovery(config_in(dir), lookup, listener);
            discovery.add_manual_endpoint("printer.local", recorder.handler());
        }
        CHECK(lookup.queued() == 1);
        while (lookup.reply_next()) {
        }
        CHECK(recorder.outcomes.empty());
    }

    SUBCASE("Add after close reports not found") {
        printprobe::ManualDiscovery discovery(config_in(dir), lookup, listener);
        REQUIRE(discovery.close().is_ok());
        CHECK(discovery.add_manual_endpoint("printer.local", recorder.handler()) == 0);
        REQUIRE(recorder.outcomes.size() == 1);
        CHECK(recorder.outcomes[0].status == printprobe::ProbeStatus::NotFound);
        CHECK(lookup.requested.empty());
    }

    SUBCASE("Lookup answering from another thread") {
        printprobe::ManualDiscovery discovery(config_in(dir), lookup, listener);
        discovery.add_manual_endpoint("printer.local", recorder.handler());

        std::thread responder([&]() {
            while (lookup.reply_next()) {
            }
        });
        responder.join();

        REQUIRE(recorder.outcomes.size() == 1);
        CHECK(recorder.outcomes[0].endpoint->uri.path == "/ipp/print");
    }

    SUBCASE("Close from the add handler persists the new endpoint") {
        printprobe::ManualDiscovery discovery(config_in(dir), lookup, listener);
        bool saved = false;
        discovery.add_manual_endpoint("printer.local", [&](const printprobe::ProbeOutcome &outcome) {
            recorder.outcomes.push_back(outcome);
            saved = discovery.close().is_ok();
        });

        std::thread responder([&]() {
            while (lookup.reply_next()) {
            }
        });
        responder.join();

        REQUIRE(recorder.outcomes.size() == 1);
        CHECK(recorder.outcomes[0].supported());
        CHECK(saved);
        auto doc = nlohmann::json::parse(fakes::read_text(dir + "/manual_printers.json"));
        REQUIRE(doc["manualPrinters"].size() == 1);
        CHECK(doc["manualPrinters"][0]["uri"] == "ipp://printer.local:631/ipp/print");
    }

    SUBCASE("Session destroyed from the add handler on the replying thread") {
        auto discovery = std::make_unique<printprobe::ManualDiscovery>(config_in(dir), lookup, listener);
        discovery->add_manual_endpoint("printer.local", [&](const printprobe::ProbeOutcome &outcome) {
            recorder.outcomes.push_back(outcome);
            discovery.reset();
        });

        std::thread responder([&]() {
            while (lookup.reply_next()) {
            }
        });
        responder.join();

        REQUIRE(recorder.outcomes.size() == 1);
        CHECK(discovery == nullptr);
        CHECK(lookup.queued() == 0);

        printprobe::ManualDiscovery reopened(config_in(dir), lookup, listener);
        REQUIRE(reopened.endpoints().size() == 1);
        CHECK(reopened.endpoints()[0].uri.to_string() == "ipp://printer.local:631/ipp/print");
    }
}

TEST_CASE("ManualDiscovery - configuration") {
    std::string dir = fakes::make_temp_dir();
    fakes::FakeLookup lookup;
    fakes::RecordingListener listener;

    SUBCASE("Defaults are valid") {
        printprobe::DiscoveryConfig config;
        CHECK(config.validate().is_ok());
        CHECK(config.candidate_paths.size() == 4);
        CHECK(config.candidate_paths[3] == "");
        CHECK(config.store_path() == "./manual_printers.json");
    }

    SUBCASE("store_path joins dir and file") {
        printprobe::DiscoveryConfig config;
        config.cache_dir = "/var/cache/print/";
        CHECK(config.store_path() == "/var/cache/print/manual_printers.json");
        config.cache_dir = "";
        CHECK(config.store_path() == "manual_printers.json");
    }

    SUBCASE("Invalid fields fall back to defaults") {
        auto config = config_in(dir);
        config.default_port = 70000;
        config.candidate_paths.clear();
        config.default_scheme = "";
        CHECK(config.validate().is_err());

        printprobe::ManualDiscovery discovery(config, lookup, listener);
        CHECK(discovery.config().default_port == 631);
        CHECK(discovery.config().candidate_paths.size() == 4);
        CHECK(discovery.config().default_scheme == "ipp");
    }
}
