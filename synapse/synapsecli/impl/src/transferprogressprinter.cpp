#include "transferprogressprinter.hpp"

#include <algorithm>
#include <cmath>

namespace synapsecli
{
TransferProgressPrinter::TransferProgressPrinter(
    std::ostream &output_stream, unsigned long long total_bytes, int print_timeout_ms)
    : output_stream_ {output_stream}
    , total_bytes_ {total_bytes}
    , print_timeout_ {print_timeout_ms}
    , latest_print_tp_ {}
    , bytes_transferred_on_latest_print_ {0}
    , completion_printed_ {false}
{}

void TransferProgressPrinter::on_progress(double percentage)
{
    auto now               = Clock::now();
    auto bytes_transferred =
        static_cast<unsigned long long>(std::llround(percentage * total_bytes_ / 100));

    if (percentage >= 100)
    {
        if (!completion_printed_)
        {
            output_stream_ << "100% - " << size_formatter_.format(total_bytes_) << '\n';
            completion_printed_ = true;
        }
        return;
    }

    if (latest_print_tp_.time_since_epoch().count() == 0)
    {
        // First progress update, cannot print now because transfer speed is TBD
        latest_print_tp_                   = now;
        bytes_transferred_on_latest_print_ = bytes_transferred;
        return;
    }

    auto elapsed_time = now - latest_print_tp_;
    if (elapsed_time < print_timeout_)
    {
        return;
    }

    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed_time).count();
    auto transfer_speed_per_sec =
        (bytes_transferred - bytes_transferred_on_latest_print_) * 1000 /
        static_cast<unsigned long long>(std::max<long long>(elapsed_ms, 1));

    output_stream_ << int(percentage) << "% - " << size_formatter_.format(bytes_transferred)
                   << " / " << size_formatter_.format(total_bytes_) << " - "
                   << size_formatter_.format(transfer_speed_per_sec) << "/s\n";

    latest_print_tp_                   = now;
    bytes_transferred_on_latest_print_ = bytes_transferred;
}
}  // namespace synapsecli
