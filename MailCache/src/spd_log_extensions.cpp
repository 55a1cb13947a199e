#include "mailcache/spd_log_extensions.hpp"
#include "mailcache/thread_utils.hpp"

SPDFlusherSink::SPDFlusherSink() :
    _unflushed(0), _exit(false)
{
    _flushThread = std::thread([this]() {
        SetThreadName("logflush");
        runFlushLoop();
    });
}

SPDFlusherSink::~SPDFlusherSink() {
    {
        std::lock_guard<std::mutex> lck(_flushMtx);
        _exit = true;
        _flushCV.notify_one();
    }
    if (_flushThread.joinable()) {
        _flushThread.join();
    }
}

void SPDFlusherSink::runFlushLoop() {
    while (true) {
        auto desiredTime = std::chrono::system_clock::now() + std::chrono::milliseconds(30000);
        {
            // Wait for a message, or for 30 seconds, whichever happens first
            std::unique_lock<std::mutex> lck(_flushMtx);
            _flushCV.wait_until(lck, desiredTime);
            if (_exit) {
                return;
            }
            if (_unflushed == 0) {
                continue; // detect, avoid spurious wakes
            }
        }

        // Debounce 1sec for more messages to arrive
        std::this_thread::sleep_for(std::chrono::milliseconds(1000));

        {
            std::unique_lock<std::mutex> lck(_flushMtx);
            _unflushed = 0;
        }

        // flushing reaches back into this sink, so it must run unlocked
        auto logger = spdlog::get("logger");
        if (logger) {
            logger->flush();
        }
    }
}

void SPDFlusherSink::sink_it_(const spdlog::details::log_msg& msg) {
    // ensure we have a flush queued
    std::lock_guard<std::mutex> lck(_flushMtx);
    _unflushed += 1;
    _flushCV.notify_one();
}

void SPDFlusherSink::flush_() {
    // no-op
}

void SPDThreadNameFlag::format(const spdlog::details::log_msg & msg, const std::tm & tm_time, spdlog::memory_buf_t & dest) {
    std::string name = GetThreadName(msg.thread_id);
    dest.append(name.data(), name.data() + name.size());
}

std::unique_ptr<spdlog::custom_flag_formatter> SPDThreadNameFlag::clone() const {
    return spdlog::details::make_unique<SPDThreadNameFlag>();
}

std::unique_ptr<spdlog::formatter> SPDFormatterWithThreadNames(const std::string & pattern) {
    auto formatter = spdlog::details::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<SPDThreadNameFlag>('N').set_pattern(pattern);
    return std::move(formatter);
}
