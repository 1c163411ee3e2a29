#include "conduit/logging/log_sink.h"

#include <cctype>
#include <cstdio>
#include <iostream>

namespace conduit {
namespace logging {

void StdioSink::log(const LogMessage& msg) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& stream = (target_ == Stdout) ? std::cout : std::cerr;
  stream << formatter_->format(msg) << '\n';
}

void StdioSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& stream = (target_ == Stdout) ? std::cout : std::cerr;
  stream.flush();
}

RotatingFileSink::RotatingFileSink(const Config& config) : config_(config) {
  openFile();
}

RotatingFileSink::~RotatingFileSink() {
  flush();
  closeFile();
}

void RotatingFileSink::log(const LogMessage& msg) {
  std::string formatted = formatter_->format(msg);

  std::lock_guard<std::mutex> lock(mutex_);
  if (!file_.is_open()) {
    openFile();
  }

  if (config_.max_file_size > 0 &&
      current_size_ + formatted.size() + 1 > config_.max_file_size) {
    rotate();
  }

  file_ << formatted << '\n';
  current_size_ += formatted.size() + 1;

  if (config_.auto_flush) {
    file_.flush();
  }
}

void RotatingFileSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
  }
}

void RotatingFileSink::openFile() {
  closeFile();
  file_.open(config_.base_filename, std::ios::app);
  if (file_.is_open()) {
    file_.seekp(0, std::ios::end);
    current_size_ = static_cast<size_t>(file_.tellp());
  }
}

void RotatingFileSink::closeFile() {
  if (file_.is_open()) {
    file_.close();
  }
}

void RotatingFileSink::rotate() {
  closeFile();

  if (config_.max_files > 0) {
    std::string oldest =
        config_.base_filename + "." + std::to_string(config_.max_files);
    std::remove(oldest.c_str());

    for (size_t i = config_.max_files - 1; i > 0; --i) {
      std::string from = config_.base_filename + "." + std::to_string(i);
      std::string to = config_.base_filename + "." + std::to_string(i + 1);
      std::rename(from.c_str(), to.c_str());
    }
  }

  std::string backup = config_.base_filename + ".1";
  std::rename(config_.base_filename.c_str(), backup.c_str());

  openFile();
  current_size_ = 0;
}

namespace {

std::unique_ptr<Formatter> createFormatter(LogFormat format) {
  if (format == LogFormat::Json) {
    return std::make_unique<JsonFormatter>();
  }
  return std::make_unique<DefaultFormatter>();
}

}  // namespace

optional<LogFormat> parseLogFormat(const std::string& name) {
  std::string lower;
  for (char c : name) {
    lower.push_back(
        static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower == "text") {
    return LogFormat::Text;
  }
  if (lower == "json") {
    return LogFormat::Json;
  }
  return nullopt;
}

std::unique_ptr<LogSink> SinkFactory::createFileSink(
    const RotatingFileSink::Config& config, LogFormat format) {
  auto sink = std::make_unique<RotatingFileSink>(config);
  sink->setFormatter(createFormatter(format));
  return sink;
}

std::unique_ptr<LogSink> SinkFactory::createStdioSink(bool use_stderr,
                                                      LogFormat format) {
  auto sink = std::make_unique<StdioSink>(use_stderr ? StdioSink::Stderr
                                                     : StdioSink::Stdout);
  sink->setFormatter(createFormatter(format));
  return sink;
}

}  // namespace logging
}  // namespace conduit
