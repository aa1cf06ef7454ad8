#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace storyforge {

// Base of every failure a render can raise. Nothing below is retried.
class RenderError : public std::runtime_error {
public:
    explicit RenderError(const std::string& message) : std::runtime_error(message) {}
};

// Malformed script line. Line numbers are 1-based.
class ParseError : public RenderError {
public:
    ParseError(int line, const std::string& raw, const std::string& reason)
        : RenderError("script parse error line " + std::to_string(line) + ": " + reason +
                      " -> '" + raw + "'")
        , line_(line)
        , raw_(raw) {}

    int line() const { return line_; }
    const std::string& raw() const { return raw_; }

private:
    int         line_;
    std::string raw_;
};

// Unknown SFX anchor symbol (anything but now, last_start, last_end).
class AnchorError : public RenderError {
public:
    AnchorError(int line, const std::string& anchor)
        : RenderError("unknown SFX anchor '" + anchor + "'" +
                      (line > 0 ? " on line " + std::to_string(line) : std::string()))
        , line_(line)
        , anchor_(anchor) {}

    int line() const { return line_; }
    const std::string& anchor() const { return anchor_; }

private:
    int         line_;
    std::string anchor_;
};

class ConfigurationError : public RenderError {
public:
    explicit ConfigurationError(const std::string& message) : RenderError(message) {}
};

class AssetResolutionError : public RenderError {
public:
    AssetResolutionError(const std::string& asset_id, const std::vector<std::string>& tried)
        : RenderError(describe(asset_id, tried))
        , asset_id_(asset_id)
        , tried_(tried) {}

    const std::string& asset_id() const { return asset_id_; }
    const std::vector<std::string>& tried() const { return tried_; }

private:
    static std::string describe(const std::string& asset_id, const std::vector<std::string>& tried) {
        std::string msg = "asset not found: " + asset_id + " (tried";
        for (size_t i = 0; i < tried.size(); ++i) {
            msg += (i == 0 ? " " : ", ") + tried[i];
        }
        return msg + ")";
    }

    std::string              asset_id_;
    std::vector<std::string> tried_;
};

class EmptyDocumentError : public RenderError {
public:
    EmptyDocumentError() : RenderError("empty document: script has no narration lines") {}
};

// Synthesis, probe, silence generation or mixing did not succeed.
class ExternalToolFailure : public RenderError {
public:
    ExternalToolFailure(const std::string& tool, int status, const std::string& output)
        : RenderError(tool + " failed (status " + std::to_string(status) + ")" +
                      (output.empty() ? std::string() : ": " + output))
        , tool_(tool)
        , status_(status)
        , output_(output) {}

    const std::string& tool() const { return tool_; }
    int status() const { return status_; }
    const std::string& output() const { return output_; }

private:
    std::string tool_;
    int         status_;
    std::string output_;
};

// Short category name used in CLI diagnostics.
const char* error_category(const RenderError& err);

} // namespace storyforge
