#pragma once
#include "protocol.hpp"
#include <map>

namespace dr {

class AgiError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

using AgiEnvironment = std::map<std::string, std::string>;

// One AGI conversation with Asterisk over a pair of streams
// (stdin/stdout in production).
class AgiSession {
public:
  AgiSession(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

  AgiSession(const AgiSession&) = delete;
  AgiSession& operator=(const AgiSession&) = delete;

  // reads "key: value" lines up to the terminating empty line
  const AgiEnvironment& read_environment() {
    env_.clear();
    std::string line;
    for (;;) {
      if (!std::getline(in_, line)) {
        throw AgiError("AGI environment ended before the blank line");
      }
      line = trim_newline(line);
      if (line.empty()) break;
      std::string key, value;
      if (!parse_env_line(line, key, value)) {
        log_warn("ignoring malformed AGI environment line: " + line);
        continue;
      }
      env_[key] = value;
    }
    log_debug("AGI environment: " + std::to_string(env_.size()) + " variables");
    return env_;
  }

  // agi_arg_1..agi_arg_N, stopping at the first missing index
  std::vector<std::string> args() const {
    std::vector<std::string> out;
    for (size_t i = 1;; ++i) {
      auto it = env_.find("agi_arg_" + std::to_string(i));
      if (it == env_.end()) break;
      out.push_back(it->second);
    }
    return out;
  }

  std::string env(const std::string& key) const {
    auto it = env_.find(key);
    return it == env_.end() ? std::string() : it->second;
  }

  AgiReply set_variable(const std::string& name, const std::string& value) {
    return command(format_set_variable(name, value));
  }

  AgiReply verbose(const std::string& msg, int level = 1) {
    return command(format_verbose(msg, level));
  }

  // sends one command line and waits for its reply
  AgiReply command(const std::string& line) {
    out_ << line;
    out_.flush();
    if (!out_) throw AgiError("AGI write failed: " + trim_newline(line));

    std::string resp;
    if (!std::getline(in_, resp)) {
      throw AgiError("AGI connection closed waiting for reply to: " + trim_newline(line));
    }
    auto reply = parse_reply(resp);
    if (!reply) throw AgiError("malformed AGI reply: " + trim_newline(resp));

    if (reply->code == AGI_USAGE && reply->text.size() > 3 && reply->text[3] == '-') {
      skip_usage_block();
    }
    if (reply->code == AGI_DEAD_CHANNEL) {
      throw AgiError("AGI channel is dead: " + trim_newline(line));
    }
    if (reply->code != AGI_OK) {
      throw AgiError("AGI command failed (" + reply->text + "): " + trim_newline(line));
    }
    return *reply;
  }

private:
  // 520- starts a multi-line usage text closed by "520 End of proper usage."
  void skip_usage_block() {
    std::string l;
    while (std::getline(in_, l)) {
      if (l.compare(0, 4, "520 ") == 0) return;
    }
  }

  std::istream& in_;
  std::ostream& out_;
  AgiEnvironment env_;
};

} // namespace dr
