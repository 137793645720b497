#pragma once

#include "core/media_format.hpp"
#include "core/media_requests.hpp"
#include "core/media_service.hpp"
#include "core/session_workspace.hpp"
#include "database/database_manager.hpp"
#include "logging/logger.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

using json = nlohmann::json;

class RouteHandlers
{
public:
    static constexpr size_t FILE_CHUNK_SIZE = 64 * 1024;
    static constexpr size_t MAX_COLLECTIONS_REPORTED = 10;

    /**
     * @brief Register the media API on a server
     *
     * The referenced objects must outlive the server.
     */
    static void setupRoutes(httplib::Server &svr, MediaService &service, DatabaseManager &db,
                            SessionWorkspaceManager &workspaces, int default_history_limit)
    {
        svr.Get("/", [](const httplib::Request &, httplib::Response &res)
                { res.set_content(json{{"message", "Media Downloader & Converter API running"}}.dump(), "application/json"); });

        svr.Get("/test", [&db](const httplib::Request &req, httplib::Response &res)
                { handleTest(req, res, db); });

        svr.Post("/api/download", [&service](const httplib::Request &req, httplib::Response &res)
                 { handleDownload(req, res, service); });

        svr.Post("/api/batch", [&service](const httplib::Request &req, httplib::Response &res)
                 { handleBatch(req, res, service); });

        svr.Post("/api/convert", [&service](const httplib::Request &req, httplib::Response &res)
                 { handleConvert(req, res, service); });

        svr.Get("/api/probe", [&service](const httplib::Request &req, httplib::Response &res)
                { handleProbe(req, res, service); });

        svr.Get("/api/file", [](const httplib::Request &req, httplib::Response &res)
                { handleGetFile(req, res); });

        svr.Get("/api/history", [&db, default_history_limit](const httplib::Request &req, httplib::Response &res)
                { handleHistory(req, res, db, default_history_limit); });

        svr.Get("/api/conversions", [&db, default_history_limit](const httplib::Request &req, httplib::Response &res)
                { handleConversions(req, res, db, default_history_limit); });

        svr.Delete(R"(/api/sessions/([^/]+))", [&workspaces](const httplib::Request &req, httplib::Response &res)
                   { handleDeleteSession(req, res, workspaces); });

        Logger::info("RouteHandlers: media API routes registered");
    }

    static json toJson(const FetchRecord &record)
    {
        return json{{"id", record.id},
                    {"session_id", record.session_id},
                    {"url", record.url},
                    {"format", record.format},
                    {"audio_only", record.audio_only},
                    {"subtitles", record.subtitles},
                    {"embed_subs", record.embed_subs},
                    {"out_dir", record.out_dir},
                    {"output_hint", record.output_hint},
                    {"stdout", record.stdout_text},
                    {"created_at", record.created_at}};
    }

    static json toJson(const ConvertRecord &record)
    {
        return json{{"id", record.id},
                    {"input", record.input},
                    {"output", record.output},
                    {"output_format", record.output_format},
                    {"start", record.start},
                    {"end", record.end},
                    {"extra_args", record.extra_args},
                    {"created_at", record.created_at}};
    }

    static json toJson(const BatchItemResult &item)
    {
        if (item.succeeded())
            return json{{"url", item.url}, {"path", item.path}};
        return json{{"url", item.url}, {"error", item.error}, {"detail", item.detail}};
    }

    /**
     * @brief Attachment header value with the file name as an RFC 7230 quoted-string
     *
     * Control characters cannot appear in a header and are replaced by '_'.
     */
    static std::string contentDisposition(const std::string &filename)
    {
        std::string quoted;
        quoted.reserve(filename.size());
        for (char c : filename)
        {
            if (c == '"' || c == '\\')
            {
                quoted += '\\';
                quoted += c;
            }
            else if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f)
            {
                quoted += '_';
            }
            else
            {
                quoted += c;
            }
        }
        return "attachment; filename=\"" + quoted + "\"";
    }

    static int statusFor(const std::string &error_kind)
    {
        if (error_kind == "RequestValidationError")
            return 422;
        if (error_kind == "InputNotFound")
            return 404;
        return 500;
    }

private:
    static void sendError(httplib::Response &res, int status, const std::string &kind, const std::string &detail)
    {
        res.status = status;
        res.set_content(json{{"error", kind}, {"detail", detail}}.dump(), "application/json");
    }

    static void sendFailure(httplib::Response &res, const std::exception &e, const std::string &context)
    {
        std::string kind = MediaService::errorKindOf(e);
        int status = statusFor(kind);
        if (status >= 500)
            Logger::error(context + " error: " + std::string(e.what()));
        else
            Logger::warn(context + " rejected: " + std::string(e.what()));
        sendError(res, status, kind, e.what());
    }

    static json parseBody(const httplib::Request &req)
    {
        try
        {
            return json::parse(req.body);
        }
        catch (const json::parse_error &e)
        {
            throw RequestValidationError("Invalid JSON body: " + std::string(e.what()));
        }
    }

    static std::string requirePathParam(const httplib::Request &req)
    {
        if (!req.has_param("path") || req.get_param_value("path").empty())
        {
            throw RequestValidationError("Missing query parameter: path");
        }
        return req.get_param_value("path");
    }

    static int limitParam(const httplib::Request &req, int default_limit)
    {
        if (!req.has_param("limit"))
            return default_limit;
        std::string value = req.get_param_value("limit");
        size_t consumed = 0;
        int limit = 0;
        try
        {
            limit = std::stoi(value, &consumed);
        }
        catch (const std::logic_error &)
        {
            throw RequestValidationError("limit must be an integer, got '" + value + "'");
        }
        if (consumed != value.size())
            throw RequestValidationError("limit must be an integer, got '" + value + "'");
        return limit;
    }

    static void handleTest(const httplib::Request &, httplib::Response &res, DatabaseManager &db)
    {
        Logger::trace("Received test request");
        json response = {{"backend", "running"},
                         {"database", "unavailable"},
                         {"database_path", db.path()},
                         {"connection_status", "Not Connected"},
                         {"collections", json::array()}};
        if (db.isOpen())
        {
            response["connection_status"] = "Connected";
            try
            {
                auto collections = db.listCollections();
                if (collections.size() > MAX_COLLECTIONS_REPORTED)
                    collections.resize(MAX_COLLECTIONS_REPORTED);
                response["collections"] = collections;
                response["database"] = "connected";
            }
            catch (const std::exception &e)
            {
                response["database"] = "error: " + std::string(e.what()).substr(0, 50);
            }
        }
        res.set_content(response.dump(), "application/json");
    }

    static void handleDownload(const httplib::Request &req, httplib::Response &res, MediaService &service)
    {
        Logger::trace("Received download request");
        try
        {
            FetchRequest request = parseFetchRequest(parseBody(req));
            std::string path = service.fetch(request);
            res.set_content(json{{"path", path}}.dump(), "application/json");
        }
        catch (const std::exception &e)
        {
            sendFailure(res, e, "Download");
        }
    }

    static void handleBatch(const httplib::Request &req, httplib::Response &res, MediaService &service)
    {
        Logger::trace("Received batch request");
        try
        {
            BatchRequest request = parseBatchRequest(parseBody(req));
            auto results = service.fetchBatch(request.urls, request.common);

            json items = json::array();
            for (const auto &item : results)
            {
                items.push_back(toJson(item));
            }
            res.set_content(json{{"items", items}}.dump(), "application/json");
        }
        catch (const std::exception &e)
        {
            sendFailure(res, e, "Batch");
        }
    }

    static void handleConvert(const httplib::Request &req, httplib::Response &res, MediaService &service)
    {
        Logger::trace("Received convert request");
        try
        {
            ConvertRequest request = parseConvertRequest(parseBody(req));
            std::string output = service.convert(request);
            res.set_content(json{{"output", output}}.dump(), "application/json");
        }
        catch (const std::exception &e)
        {
            sendFailure(res, e, "Convert");
        }
    }

    static void handleProbe(const httplib::Request &req, httplib::Response &res, MediaService &service)
    {
        Logger::trace("Received probe request");
        try
        {
            std::string raw = service.probe(requirePathParam(req));
            res.set_content(json{{"raw", raw}}.dump(), "application/json");
        }
        catch (const std::exception &e)
        {
            sendFailure(res, e, "Probe");
        }
    }

    static void handleGetFile(const httplib::Request &req, httplib::Response &res)
    {
        Logger::trace("Received file request");
        std::string path;
        try
        {
            path = requirePathParam(req);
        }
        catch (const RequestValidationError &e)
        {
            sendError(res, 422, "RequestValidationError", e.what());
            return;
        }

        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
        {
            sendError(res, 404, "InputNotFound", "File not found");
            return;
        }
        auto size = std::filesystem::file_size(path, ec);
        auto file = std::make_shared<std::ifstream>(path, std::ios::binary);
        if (ec || !file->is_open())
        {
            sendError(res, 404, "InputNotFound", "File not found");
            return;
        }

        std::filesystem::path fs_path(path);
        std::string content_type = "application/octet-stream";
        std::string extension = fs_path.extension().string();
        if (!extension.empty())
        {
            if (auto format = MediaFormats::fromString(extension.substr(1)))
                content_type = MediaFormats::getMimeType(*format);
        }

        res.set_header("Content-Disposition", contentDisposition(fs_path.filename().string()));
        res.set_content_provider(
            static_cast<size_t>(size), content_type,
            [file](size_t offset, size_t length, httplib::DataSink &sink)
            {
                std::vector<char> buffer(std::min(length, FILE_CHUNK_SIZE));
                file->seekg(static_cast<std::streamoff>(offset));
                file->read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                std::streamsize got = file->gcount();
                if (got <= 0)
                    return false;
                return sink.write(buffer.data(), static_cast<size_t>(got));
            });
        Logger::debug("Streaming " + path + " (" + std::to_string(size) + " bytes)");
    }

    static void handleHistory(const httplib::Request &req, httplib::Response &res, DatabaseManager &db, int default_limit)
    {
        Logger::trace("Received history request");
        int limit = default_limit;
        try
        {
            limit = limitParam(req, default_limit);
        }
        catch (const RequestValidationError &e)
        {
            sendError(res, 422, "RequestValidationError", e.what());
            return;
        }

        json items = json::array();
        try
        {
            for (const auto &record : db.getFetchHistory(limit))
            {
                items.push_back(toJson(record));
            }
        }
        catch (const std::exception &e)
        {
            Logger::warn("History lookup failed: " + std::string(e.what()));
            items = json::array();
        }
        res.set_content(json{{"items", items}}.dump(), "application/json");
    }

    static void handleConversions(const httplib::Request &req, httplib::Response &res, DatabaseManager &db, int default_limit)
    {
        Logger::trace("Received conversions request");
        int limit = default_limit;
        try
        {
            limit = limitParam(req, default_limit);
        }
        catch (const RequestValidationError &e)
        {
            sendError(res, 422, "RequestValidationError", e.what());
            return;
        }

        json items = json::array();
        try
        {
            for (const auto &record : db.getConversions(limit))
            {
                items.push_back(toJson(record));
            }
        }
        catch (const std::exception &e)
        {
            Logger::warn("Conversions lookup failed: " + std::string(e.what()));
            items = json::array();
        }
        res.set_content(json{{"items", items}}.dump(), "application/json");
    }

    static void handleDeleteSession(const httplib::Request &req, httplib::Response &res, SessionWorkspaceManager &workspaces)
    {
        std::string id = req.matches[1];
        Logger::trace("Received delete session request for " + id);
        try
        {
            if (!workspaces.removeSession(id))
            {
                sendError(res, 404, "SessionNotFound", "No session " + id);
                return;
            }
            res.set_content(json{{"removed", id}}.dump(), "application/json");
        }
        catch (const std::invalid_argument &e)
        {
            sendError(res, 422, "RequestValidationError", e.what());
        }
        catch (const std::exception &e)
        {
            Logger::error("Delete session error: " + std::string(e.what()));
            sendError(res, 500, "InternalError", e.what());
        }
    }
};
