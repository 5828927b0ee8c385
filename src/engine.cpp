#include "chunkscribe/engine.hpp"

#include <cstdio>
#include <memory>
#include <stdexcept>

#include <sys/wait.h>

#include "chunkscribe/errors.hpp"

namespace chunkscribe {

// ─── Engine Output Parsing ──────────────────────────────────────────────────

namespace {

const nlohmann::json &word_array(const nlohmann::json &doc) {
    if (doc.is_array())
        return doc;
    if (doc.is_object()) {
        if (doc.contains("words") && doc["words"].is_array())
            return doc["words"];
        if (doc.contains("timestamp") && doc["timestamp"].is_object()) {
            const auto &ts = doc["timestamp"];
            if (ts.contains("word") && ts["word"].is_array())
                return ts["word"];
        }
    }
    throw std::runtime_error("engine output has no word list");
}

double number_or(const nlohmann::json &w, const char *key, double fallback) {
    auto it = w.find(key);
    if (it == w.end() || it->is_null())
        return fallback;
    if (!it->is_number())
        throw std::runtime_error(std::string("word field '") + key +
                                 "' is not a number");
    return it->get<double>();
}

} // namespace

std::vector<WordToken> parse_word_tokens(const nlohmann::json &doc) {
    std::vector<WordToken> words;
    for (const auto &w : word_array(doc)) {
        if (!w.is_object())
            throw std::runtime_error("word entry is not an object");

        WordToken tok;
        if (w.contains("word") && w["word"].is_string())
            tok.text = w["word"].get<std::string>();
        else if (w.contains("text") && w["text"].is_string())
            tok.text = w["text"].get<std::string>();

        tok.start = number_or(w, "start", 0.0);
        tok.end = number_or(w, "end", 0.0);
        tok.confidence = w.contains("confidence")
                             ? number_or(w, "confidence", 1.0)
                             : number_or(w, "score", 1.0);
        words.push_back(std::move(tok));
    }
    return words;
}

std::vector<WordToken> parse_engine_output(const std::string &text) {
    auto doc = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded())
        throw std::runtime_error("engine output is not valid JSON");
    return parse_word_tokens(doc);
}

// ─── Command Engine ─────────────────────────────────────────────────────────

std::string shell_quote(const std::string &arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'')
            out += "'\\''";
        else
            out += c;
    }
    out += '\'';
    return out;
}

CommandEngine::CommandEngine(const EngineConfig &config, std::string language)
    : config_(config), language_(std::move(language)) {
    if (config_.command.empty())
        throw ConfigError("engine command is empty");
}

std::string CommandEngine::command_for(const std::string &audio_path) const {
    std::string cmd = config_.command;

    auto substitute = [&cmd](const std::string &key, const std::string &value) {
        bool found = false;
        size_t pos = 0;
        while ((pos = cmd.find(key, pos)) != std::string::npos) {
            cmd.replace(pos, key.size(), value);
            pos += value.size();
            found = true;
        }
        return found;
    };

    bool has_audio = substitute("{audio}", shell_quote(audio_path));
    substitute("{model}", shell_quote(config_.model));
    substitute("{language}", shell_quote(language_));

    if (!has_audio)
        cmd += " " + shell_quote(audio_path);
    return cmd;
}

std::vector<WordToken> CommandEngine::transcribe(const std::string &audio_path) {
    std::string cmd = command_for(audio_path);

    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(cmd.c_str(), "r"),
                                                  pclose);
    if (!pipe)
        throw std::runtime_error("Failed to execute engine command: " + cmd);

    std::string output;
    char buffer[4096];
    while (size_t n = fread(buffer, 1, sizeof(buffer), pipe.get()))
        output.append(buffer, n);

    int status = pclose(pipe.release());
    if (status == -1)
        throw std::runtime_error("Failed to wait for engine command");
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        throw std::runtime_error("engine command exited with status " +
                                 std::to_string(code));
    }

    return parse_engine_output(output);
}

} // namespace chunkscribe
