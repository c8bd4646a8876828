#include "http_gateway.hpp"
#include "logger.hpp"
#include "object_key.hpp"
#include "store_error.hpp"
#include <algorithm>
#include <memory>
#include <optional>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

void SendJson(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

void SendError(httplib::Response& res, int status, const std::string& message) {
    json err;
    err["error"] = message;
    SendJson(res, status, err);
}

// Raw store detail goes to the log only; the client gets the public message.
void SendStoreError(httplib::Response& res, const StoreError& e, const std::string& operation) {
    int status = HttpStatusFor(e.Kind());
    if (status >= 500) {
        Logger::Error(operation + " failed (" + KindName(e.Kind()) + "): " + e.what(), "HTTP");
    } else {
        Logger::Info(operation + " rejected (" + KindName(e.Kind()) + "): " + e.what(), "HTTP");
    }
    SendError(res, status, e.PublicMessage());
}

void SendInternalError(httplib::Response& res, const std::exception& e, const std::string& operation) {
    Logger::Error(operation + " failed unexpectedly: " + e.what(), "HTTP");
    SendError(res, 500, GenericMessage(StoreErrorKind::Internal));
}

std::string AttachmentName(const std::string& key) {
    std::string name;
    for (char c : KeyFromFilename(key)) {
        if (c != '"' && c != '\\') name += c;
    }
    return name;
}

json ParseJsonBody(const httplib::Request& req) {
    json body = json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        throw StoreError(StoreErrorKind::InvalidArgument, "Malformed JSON body", "Request body must be a JSON object");
    }
    return body;
}

std::string RequiredString(const json& body, const char* field) {
    if (!body.contains(field) || !body[field].is_string()) {
        std::string message = std::string("'") + field + "' must be a string";
        throw StoreError(StoreErrorKind::InvalidArgument, message, message);
    }
    return body[field].get<std::string>();
}

std::optional<int64_t> OptionalInteger(const json& body, const char* field) {
    if (!body.contains(field) || body[field].is_null()) return std::nullopt;
    if (!body[field].is_number_integer()) {
        std::string message = std::string("'") + field + "' must be an integer";
        throw StoreError(StoreErrorKind::InvalidArgument, message, message);
    }
    return body[field].get<int64_t>();
}

json GrantToJson(const PresignedGrant& grant) {
    json j;
    j["key"] = grant.key;
    j["url"] = grant.url;
    j["method"] = grant.method;
    j["headers"] = json::object();
    for (const auto& header : grant.headers) {
        j["headers"][header.first] = header.second;
    }
    j["expires_in"] = grant.expires_in;
    j["expires_at"] = grant.expires_at;
    return j;
}

} // namespace

void RegisterRoutes(httplib::Server& svr, ObjectStore& store, const Presigner& presigner,
                    const Config::ServerConfig& config) {
    svr.set_payload_max_length(static_cast<size_t>(config.max_upload_bytes));

    // CORS for browser clients using presigned flows
    svr.set_pre_routing_handler([](const httplib::Request& req, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");

        if (req.method == "OPTIONS") {
            res.status = 204;
            return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled;
    });

    svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        Logger::Info(req.method + " " + req.path + " " + std::to_string(res.status), "HTTP");
    });

    // GET /health
    svr.Get("/health", [&store](const httplib::Request&, httplib::Response& res) {
        if (store.Ping()) {
            json j;
            j["ok"] = true;
            SendJson(res, 200, j);
            return;
        }
        json j;
        j["ok"] = false;
        j["error"] = "Storage connection unhealthy";
        SendJson(res, 503, j);
    });

    // POST /files/presign/upload {"key","content_type","content_length","expires_in"}
    svr.Post("/files/presign/upload", [&presigner](const httplib::Request& req, httplib::Response& res) {
        try {
            json body = ParseJsonBody(req);
            std::string key = RequiredString(body, "key");
            std::string content_type = "application/octet-stream";
            if (body.contains("content_type") && !body["content_type"].is_null()) {
                content_type = RequiredString(body, "content_type");
            }
            std::optional<int64_t> content_length = OptionalInteger(body, "content_length");
            if (!content_length) {
                throw StoreError(StoreErrorKind::InvalidArgument, "Missing content_length",
                                 "'content_length' must be an integer");
            }

            PresignedGrant grant = presigner.PresignUpload(key, content_type, *content_length,
                                                           OptionalInteger(body, "expires_in"));
            SendJson(res, 200, GrantToJson(grant));
        } catch (const StoreError& e) {
            SendStoreError(res, e, "Presign upload");
        } catch (const std::exception& e) {
            SendInternalError(res, e, "Presign upload");
        }
    });

    // POST /files/presign/download {"key","expires_in"}
    // The key is not checked for existence; the store rejects a missing object when the URL is used.
    svr.Post("/files/presign/download", [&presigner](const httplib::Request& req, httplib::Response& res) {
        try {
            json body = ParseJsonBody(req);
            PresignedGrant grant = presigner.PresignDownload(RequiredString(body, "key"),
                                                             OptionalInteger(body, "expires_in"));
            SendJson(res, 200, GrantToJson(grant));
        } catch (const StoreError& e) {
            SendStoreError(res, e, "Presign download");
        } catch (const std::exception& e) {
            SendInternalError(res, e, "Presign download");
        }
    });

    // POST /files/upload?key=... (multipart/form-data, field "file")
    svr.Post("/files/upload", [&store](const httplib::Request& req, httplib::Response& res,
                                       const httplib::ContentReader& content_reader) {
        if (!req.is_multipart_form_data()) {
            SendError(res, 400, "Expected multipart/form-data with a 'file' field");
            return;
        }

        std::string explicit_key = req.has_param("key") ? req.get_param_value("key") : "";
        std::unique_ptr<UploadStream> upload;
        std::optional<StoreError> failure;
        std::string key;
        std::string filename;
        std::string content_type;
        bool seen_file = false;
        bool in_file = false;

        try {
            bool completed = content_reader(
                [&](const httplib::MultipartFormData& part) {
                    in_file = false;
                    if (part.name != "file") return true;
                    if (seen_file) {
                        failure.emplace(StoreErrorKind::InvalidArgument, "More than one file part",
                                        "Only one 'file' part is accepted");
                        return false;
                    }
                    seen_file = true;
                    in_file = true;
                    filename = part.filename;
                    content_type = part.content_type.empty() ? "application/octet-stream" : part.content_type;
                    try {
                        key = ResolveUploadKey(explicit_key, filename);
                        upload = store.BeginUpload(key, content_type);
                    } catch (const StoreError& e) {
                        failure.emplace(e);
                        return false;
                    }
                    return true;
                },
                [&](const char* data, size_t data_length) {
                    if (!in_file) return true;
                    try {
                        upload->Write(data, data_length);
                    } catch (const StoreError& e) {
                        failure.emplace(e);
                        return false;
                    }
                    return true;
                });

            if (failure) {
                upload.reset();
                SendStoreError(res, *failure, "Upload " + key);
                return;
            }
            if (!completed) {
                upload.reset();
                Logger::Warn("Upload of " + key + " interrupted by the client; aborted", "HTTP");
                SendError(res, 400, "Upload interrupted");
                return;
            }
            if (!seen_file) {
                SendError(res, 400, "Missing 'file' part");
                return;
            }

            ObjectInfo stored = upload->Commit();
            Logger::Info("Stored " + key + " (" + std::to_string(stored.content_length) + " bytes)", "HTTP");

            json response;
            response["message"] = "File uploaded successfully";
            response["key"] = stored.key;
            response["filename"] = filename;
            response["content_type"] = stored.content_type;
            response["size"] = stored.content_length;
            response["etag"] = stored.etag;
            SendJson(res, 200, response);
        } catch (const StoreError& e) {
            upload.reset();
            SendStoreError(res, e, "Upload " + key);
        } catch (const std::exception& e) {
            upload.reset();
            SendInternalError(res, e, "Upload " + key);
        }
    });

    // GET /files/{key}/metadata
    svr.Get(R"(/files/(.+)/metadata)", [&store](const httplib::Request& req, httplib::Response& res) {
        std::string key = req.matches[1];
        try {
            ValidateObjectKey(key);
            ObjectInfo info = store.Stat(key);

            json response;
            response["key"] = info.key;
            response["content_length"] = info.content_length;
            response["content_type"] = info.content_type;
            response["etag"] = info.etag;
            response["last_modified"] = info.last_modified.empty() ? json(nullptr) : json(info.last_modified);
            SendJson(res, 200, response);
        } catch (const StoreError& e) {
            SendStoreError(res, e, "Metadata " + key);
        } catch (const std::exception& e) {
            SendInternalError(res, e, "Metadata " + key);
        }
    });

    // GET /files/{key}
    svr.Get(R"(/files/(.+))", [&store](const httplib::Request& req, httplib::Response& res) {
        std::string key = req.matches[1];
        try {
            ValidateObjectKey(key);
            // Stat first so a missing key is a clean 404 before any body is sent.
            ObjectInfo info = store.Stat(key);

            res.set_header("Content-Disposition", "attachment; filename=\"" + AttachmentName(key) + "\"");
            if (!info.etag.empty()) res.set_header("ETag", info.etag);

            if (info.content_length == 0) {
                res.set_content("", info.content_type);
                return;
            }

            res.set_content_provider(
                static_cast<size_t>(info.content_length), info.content_type,
                // httplib serves Range requests by asking for exactly [offset, offset + length).
                [&store, key](size_t offset, size_t length, httplib::DataSink& sink) {
                    try {
                        size_t remaining = length;
                        bool finished = store.Read(key, offset, length, [&sink, &remaining](const char* data, size_t size) {
                            size_t take = std::min(size, remaining);
                            remaining -= take;
                            return take == 0 || sink.write(data, take);
                        });
                        if (!finished) {
                            Logger::Warn("Download of " + key + " cancelled by the client", "HTTP");
                        }
                        return finished;
                    } catch (const StoreError& e) {
                        Logger::Error("Download of " + key + " failed mid-stream (" + KindName(e.Kind()) +
                                      "): " + e.what(), "HTTP");
                        return false;
                    }
                });
        } catch (const StoreError& e) {
            SendStoreError(res, e, "Download " + key);
        } catch (const std::exception& e) {
            SendInternalError(res, e, "Download " + key);
        }
    });

    // DELETE /files/{key} (absent keys succeed)
    svr.Delete(R"(/files/(.+))", [&store](const httplib::Request& req, httplib::Response& res) {
        std::string key = req.matches[1];
        try {
            ValidateObjectKey(key);
            store.Remove(key);

            json response;
            response["message"] = "File deleted successfully";
            response["key"] = key;
            SendJson(res, 200, response);
        } catch (const StoreError& e) {
            SendStoreError(res, e, "Delete " + key);
        } catch (const std::exception& e) {
            SendInternalError(res, e, "Delete " + key);
        }
    });
}

bool RunHTTPServer(httplib::Server& svr, const Config::ServerConfig& config) {
    Logger::Info("HTTP Gateway listening on " + config.listen_address + ":" + std::to_string(config.port));
    if (!svr.listen(config.listen_address, config.port)) {
        Logger::Fatal("Failed to listen on " + config.listen_address + ":" + std::to_string(config.port));
        return false;
    }
    return true;
}
