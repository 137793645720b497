#pragma once

#include <string>
#include "server_config.hpp"

class OpenApiDocs
{
public:
  static const std::string &getSpec()
  {
    static const std::string spec = R"({
  "openapi": "3.0.0",
  "info": {
    "title": ")" + std::string(ServerConfig::API_TITLE) +
                                    R"(",
    "version": ")" + std::string(ServerConfig::API_VERSION) +
                                    R"(",
    "description": "Downloads remote media with yt-dlp and converts or probes local files with ffmpeg/ffprobe"
  },
  "components": {
    "schemas": {
      "Error": {
        "type": "object",
        "properties": {
          "error": { "type": "string", "description": "Error kind, e.g. ExternalToolFailure" },
          "detail": { "type": "string", "description": "Diagnostic text (tool output is truncated to its last 2000 characters)" }
        }
      },
      "DownloadRequest": {
        "type": "object",
        "required": ["url"],
        "properties": {
          "url": { "type": "string", "description": "Source media URL" },
          "format": { "type": "string", "enum": ["mp3", "mp4", "wav", "mkv", "webm", "m4a", "opus"], "default": "mp4" },
          "quality": { "type": "string", "default": "best", "description": "'best', 'worst' or a yt-dlp format selector" },
          "subtitles": { "type": "boolean", "default": false },
          "subtitle_langs": { "type": "array", "items": { "type": "string" }, "default": ["en"] },
          "embed_subs": { "type": "boolean", "default": false },
          "audio_only": { "type": "boolean", "default": false },
          "filename_template": { "type": "string", "description": "Relative yt-dlp output template inside the session directory" },
          "ffmpeg_args": { "type": "array", "items": { "type": "string" }, "description": "Extra FFmpeg arguments used during post-processing" }
        }
      },
      "ConvertRequest": {
        "type": "object",
        "required": ["input_path", "output_format"],
        "properties": {
          "input_path": { "type": "string" },
          "output_format": { "type": "string", "enum": ["mp3", "mp4", "wav", "mkv", "webm", "m4a", "opus"] },
          "start": { "type": "string", "example": "00:00:10" },
          "end": { "type": "string", "example": "00:00:20" },
          "extra_args": { "type": "array", "items": { "type": "string" } }
        }
      }
    }
  },
  "paths": {
    "/": {
      "get": {
        "summary": "Service banner",
        "tags": ["Health"],
        "responses": { "200": { "description": "Service is running" } }
      }
    },
    "/test": {
      "get": {
        "summary": "Backend and database health",
        "tags": ["Health"],
        "responses": { "200": { "description": "Backend status, database status and collection names" } }
      }
    },
    "/api/download": {
      "post": {
        "summary": "Download media into a new session directory",
        "tags": ["Media"],
        "requestBody": {
          "required": true,
          "content": { "application/json": { "schema": { "$ref": "#/components/schemas/DownloadRequest" } } }
        },
        "responses": {
          "200": {
            "description": "Path of the downloaded file (or the session directory when no media file was identified)",
            "content": { "application/json": { "schema": { "type": "object", "properties": { "path": { "type": "string" } } } } }
          },
          "422": { "description": "Invalid request", "content": { "application/json": { "schema": { "$ref": "#/components/schemas/Error" } } } },
          "500": { "description": "yt-dlp failed", "content": { "application/json": { "schema": { "$ref": "#/components/schemas/Error" } } } }
        }
      }
    },
    "/api/batch": {
      "post": {
        "summary": "Download several URLs with shared options",
        "tags": ["Media"],
        "requestBody": {
          "required": true,
          "content": {
            "application/json": {
              "schema": {
                "type": "object",
                "required": ["urls"],
                "properties": {
                  "urls": { "type": "array", "items": { "type": "string" } },
                  "common": { "$ref": "#/components/schemas/DownloadRequest" }
                }
              }
            }
          }
        },
        "responses": {
          "200": { "description": "One item per URL, in request order, each with either path or error/detail" },
          "422": { "description": "Invalid request", "content": { "application/json": { "schema": { "$ref": "#/components/schemas/Error" } } } }
        }
      }
    },
    "/api/convert": {
      "post": {
        "summary": "Transcode and optionally trim a local file",
        "tags": ["Media"],
        "requestBody": {
          "required": true,
          "content": { "application/json": { "schema": { "$ref": "#/components/schemas/ConvertRequest" } } }
        },
        "responses": {
          "200": {
            "description": "Output path (<input without extension>_conv.<format>)",
            "content": { "application/json": { "schema": { "type": "object", "properties": { "output": { "type": "string" } } } } }
          },
          "404": { "description": "Input file not found", "content": { "application/json": { "schema": { "$ref": "#/components/schemas/Error" } } } },
          "422": { "description": "Invalid request", "content": { "application/json": { "schema": { "$ref": "#/components/schemas/Error" } } } },
          "500": { "description": "ffmpeg failed", "content": { "application/json": { "schema": { "$ref": "#/components/schemas/Error" } } } }
        }
      }
    },
    "/api/probe": {
      "get": {
        "summary": "Raw ffprobe report for a local file",
        "tags": ["Media"],
        "parameters": [{ "name": "path", "in": "query", "required": true, "schema": { "type": "string" } }],
        "responses": {
          "200": { "description": "Probe output", "content": { "application/json": { "schema": { "type": "object", "properties": { "raw": { "type": "string" } } } } } },
          "404": { "description": "File not found" }
        }
      }
    },
    "/api/file": {
      "get": {
        "summary": "Download a local file as an attachment",
        "tags": ["Media"],
        "parameters": [{ "name": "path", "in": "query", "required": true, "schema": { "type": "string" } }],
        "responses": {
          "200": { "description": "File contents" },
          "404": { "description": "File not found" }
        }
      }
    },
    "/api/history": {
      "get": {
        "summary": "Most recent downloads, newest first",
        "tags": ["History"],
        "parameters": [{ "name": "limit", "in": "query", "schema": { "type": "integer", "default": 20 } }],
        "responses": { "200": { "description": "Items (empty when the store is unavailable)" } }
      }
    },
    "/api/conversions": {
      "get": {
        "summary": "Most recent conversions, newest first",
        "tags": ["History"],
        "parameters": [{ "name": "limit", "in": "query", "schema": { "type": "integer", "default": 20 } }],
        "responses": { "200": { "description": "Items (empty when the store is unavailable)" } }
      }
    },
    "/api/sessions/{id}": {
      "delete": {
        "summary": "Delete a session directory and its files",
        "tags": ["Sessions"],
        "parameters": [{ "name": "id", "in": "path", "required": true, "schema": { "type": "string", "format": "uuid" } }],
        "responses": {
          "200": { "description": "Session removed" },
          "404": { "description": "No such session" },
          "422": { "description": "Malformed session id" }
        }
      }
    }
  }
})";
    return spec;
  }

  static std::string getSwaggerUI()
  {
    return R"(
<!DOCTYPE html>
<html>
<head>
    <title>)" +
           std::string(ServerConfig::API_TITLE) + R"( - Swagger UI</title>
    <link rel="stylesheet" type="text/css" href="https://unpkg.com/swagger-ui-dist@5.9.0/swagger-ui.css" />
    <style>
        html { box-sizing: border-box; overflow-y: scroll; }
        body { margin:0; background: #fafafa; }
    </style>
</head>
<body>
    <div id="swagger-ui"></div>
    <script src="https://unpkg.com/swagger-ui-dist@5.9.0/swagger-ui-bundle.js"></script>
    <script>
        window.onload = function() {
            SwaggerUIBundle({
                url: ")" +
           std::string(ServerConfig::SWAGGER_JSON_PATH) + R"(",
                dom_id: '#swagger-ui',
                deepLinking: true,
                presets: [SwaggerUIBundle.presets.apis]
            });
        };
    </script>
</body>
</html>
    )";
  }
};
