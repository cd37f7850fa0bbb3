#pragma once

#include "output/sink.hpp"

#include <string_view>

namespace refcheck {

class StdoutSink : public Sink
{
public:
    void write(std::string_view str) override;
    void flush() override;

    ~StdoutSink() override = default;
};

} // namespace refcheck
