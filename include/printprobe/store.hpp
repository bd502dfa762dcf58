#pragma once

#include <nlohmann/json.hpp>
#include <printprobe/endpoint.hpp>

namespace printprobe {

    // Top-level key of the persisted document
    constexpr const char *MANUAL_PRINTERS_KEY = "manualPrinters";

    inline nlohmann::json to_json(const Endpoint &endpoint) {
        nlohmann::json j;
        if (endpoint.uuid) {
            j["uuid"] = to_std(*endpoint.uuid);
        }
        j["name"] = to_std(endpoint.name);
        j["uri"] = to_std(endpoint.uri.to_string());
        if (endpoint.location) {
            j["location"] = to_std(*endpoint.location);
        }
        return j;
    }

    namespace detail {

        // Optional string field: absent or null is fine, any other type is not
        inline dp::Res<std::optional<dp::String>> optional_string(const nlohmann::json &j, const char *key) {
            auto it = j.find(key);
            if (it == j.end() || it->is_null()) {
                return dp::result::ok(std::optional<dp::String>());
            }
            if (!it->is_string()) {
                return dp::result::err(dp::Error::invalid_argument(dp::String("field is not a string: ") + key));
            }
            return dp::result::ok(std::optional<dp::String>(to_dp(it->get<std::string>())));
        }

    } // namespace detail

    // Decode one persisted endpoint record
    // The stored URI gets the default port if it lacks one; a missing name falls back to the host
    inline dp::Res<Endpoint> endpoint_from_json(const nlohmann::json &j, dp::i32 default_port = DEFAULT_IPP_PORT) {
        if (!j.is_object()) {
            return dp::result::err(dp::Error::invalid_argument("endpoint record is not an object"));
        }

        auto uri_it = j.find("uri");
        if (uri_it == j.end() || !uri_it->is_string()) {
            return dp::result::err(dp::Error::invalid_argument("endpoint record has no uri"));
        }
        auto uri_res = parse_uri(to_dp(uri_it->get<std::string>()));
        if (uri_res.is_err()) {
            return dp::result::err(uri_res.error());
        }

        auto uuid_res = detail::optional_string(j, "uuid");
        if (uuid_res.is_err()) {
            return dp::result::err(uuid_res.error());
        }
        auto name_res = detail::optional_string(j, "name");
        if (name_res.is_err()) {
            return dp::result::err(name_res.error());
        }
        auto location_res = detail::optional_string(j, "location");
        if (location_res.is_err()) {
            return dp::result::err(location_res.error());
        }

        Endpoint endpoint;
        endpoint.uri = uri_res.value().with_default_port(default_port);
        endpoint.uuid = uuid_res.value();
        if (endpoint.uuid && endpoint.uuid->empty()) {
            endpoint.uuid.reset();
        }
        auto name = name_res.value();
        endpoint.name = (name && !name->empty()) ? *name : endpoint.uri.host;
        endpoint.location = location_res.value();
        return dp::result::ok(endpoint);
    }

    // On-disk JSON document holding the manual endpoint list
    // Layout: {"manualPrinters": [ {uuid?, name, uri, location?}, ... ]}, most recent first
    class EndpointStore {
      private:
        dp::String path_;
        dp::i32 default_port_;

      public:
        explicit EndpointStore(dp::String path, dp::i32 default_port = DEFAULT_IPP_PORT)
            : path_(std::move(path)), default_port_(default_port) {
            echo::trace("EndpointStore constructed, path=", path_.c_str());
        }

        const dp::String &path() const { return path_; }

        /// Read the stored list into out, in stored order
        /// Records decoded before a malformed record are kept in out; decoding stops there.
        /// @return not_found if there is no file, io_error if it cannot be read,
        ///         invalid_argument if the document or a record is malformed
        dp::Res<void> load(dp::Vector<Endpoint> &out) const {
            auto read_res = read_file(path_);
            if (read_res.is_err()) {
                return dp::result::err(read_res.error());
            }

            nlohmann::json doc;
            try {
                doc = nlohmann::json::parse(read_res.value());
            } catch (const nlohmann::json::parse_error &e) {
                echo::trace("store parse error: ", e.what());
                return dp::result::err(dp::Error::invalid_argument(dp::String("malformed document: ") + e.what()));
            }

            if (!doc.is_object()) {
                return dp::result::err(dp::Error::invalid_argument("document is not an object"));
            }

            auto list_it = doc.find(MANUAL_PRINTERS_KEY);
            if (list_it == doc.end()) {
                echo::debug("store has no ", MANUAL_PRINTERS_KEY, " entry");
                return dp::result::ok();
            }
            if (!list_it->is_array()) {
                return dp::result::err(dp::Error::invalid_argument("manualPrinters is not an array"));
            }

            for (const auto &record : *list_it) {
                auto endpoint_res = endpoint_from_json(record, default_port_);
                if (endpoint_res.is_err()) {
                    echo::trace("store record rejected: ", endpoint_res.error().message.c_str());
                    return dp::result::err(endpoint_res.error());
                }
                out.push_back(endpoint_res.value());
            }

            echo::trace("store loaded ", out.size(), " endpoints from ", path_.c_str());
            return dp::result::ok();
        }

        /// Replace the stored list with endpoints, atomically
        dp::Res<void> save(const dp::Vector<Endpoint> &endpoints) const {
            nlohmann::json list = nlohmann::json::array();
            for (const auto &endpoint : endpoints) {
                list.push_back(to_json(endpoint));
            }
            nlohmann::json doc;
            doc[MANUAL_PRINTERS_KEY] = std::move(list);

            std::string text;
            try {
                text = doc.dump();
            } catch (const nlohmann::json::exception &e) {
                // Names and locations come from devices and need not be valid UTF-8
                echo::error("cannot encode endpoints for ", path_.c_str(), ": ", e.what());
                return dp::result::err(dp::Error::invalid_argument(dp::String("cannot encode endpoints: ") + e.what()));
            }
            return write_file_atomic(path_, text);
        }
    };

} // namespace printprobe
