//
// Queue of PTY output chunks.
//
// Copyright (c) 2025 Serge Vakulenko
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//
#ifndef BYTE_CHANNEL_H
#define BYTE_CHANNEL_H

#include <deque>
#include <mutex>
#include <string>
#include <utility>

//
// Single-producer, single-consumer queue of byte chunks.
// The reader thread pushes, the owner of the session drains.
//
class ByteChannel {
public:
    void push(std::string chunk)
    {
        std::lock_guard<std::mutex> lock(mutex);
        chunks.push_back(std::move(chunk));
    }

    // Concatenation of all queued chunks; never blocks on I/O.
    std::string drain()
    {
        std::deque<std::string> pending;
        {
            std::lock_guard<std::mutex> lock(mutex);
            pending.swap(chunks);
        }
        std::string result;
        for (auto &chunk : pending) {
            result += chunk;
        }
        return result;
    }

    // Producer has exited, no more chunks will arrive
    void finish()
    {
        std::lock_guard<std::mutex> lock(mutex);
        finished = true;
    }

    bool is_finished() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return finished;
    }

private:
    mutable std::mutex mutex;
    std::deque<std::string> chunks;
    bool finished{};
};

#endif // BYTE_CHANNEL_H
