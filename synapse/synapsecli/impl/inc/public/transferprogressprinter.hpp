#ifndef SYNAPSECLI_TRANSFERPROGRESSPRINTER_HPP_
#define SYNAPSECLI_TRANSFERPROGRESSPRINTER_HPP_

#include <chrono>
#include <ostream>

#include "datasizeformatter.hpp"

namespace synapsecli
{
// Prints at most one line per print timeout, plus one when the transfer completes
class TransferProgressPrinter
{
public:
    TransferProgressPrinter(
        std::ostream &output_stream, unsigned long long total_bytes, int print_timeout_ms);

    void on_progress(double percentage);

private:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    std::ostream             &output_stream_;
    const unsigned long long  total_bytes_;
    std::chrono::milliseconds print_timeout_;
    TimePoint                 latest_print_tp_;
    unsigned long long        bytes_transferred_on_latest_print_;
    bool                      completion_printed_;
    DataSizeFormatter         size_formatter_;
};
}  // namespace synapsecli

#endif  // SYNAPSECLI_TRANSFERPROGRESSPRINTER_HPP_
