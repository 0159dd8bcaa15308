#pragma once

#include <istream>
#include <iterator>
#include <ostream>
#include <string>

namespace cloudclip::client {

// Local clipboard as seen by the client. OS-specific backends live outside
// this project; the CLI uses StreamClipboard.
class Clipboard {
public:
    virtual ~Clipboard() = default;

    virtual std::string read() = 0;
    virtual void write(const std::string& text) = 0;
};

// Reads the whole input stream as the clipboard text, writes pulled text
// to the output stream unchanged.
class StreamClipboard : public Clipboard {
public:
    StreamClipboard(std::istream& in, std::ostream& out)
        : in_(in),
          out_(out) {}

    std::string read() override {
        return std::string(std::istreambuf_iterator<char>(in_), std::istreambuf_iterator<char>());
    }

    void write(const std::string& text) override {
        out_ << text;
        out_.flush();
    }

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace cloudclip::client
