/**
 * Tick report serialisation.
 *
 * Format: { "ticks": [ {tick, error, economy, commands, diagnostics, forecast?}, ... ] }
 * "commands" uses the same objects CommandQueue::write_json sends to the host.
 */

#ifndef SPIRITS_GAME_REPORT_WRITER_HPP
#define SPIRITS_GAME_REPORT_WRITER_HPP

#include "game/tick_driver.hpp"
#include "io/json_writer.hpp"
#include <ostream>
#include <vector>

namespace spirits::game {

void write_tick_report(JsonWriter& w, const TickResult& result);

void write_report_json(const std::vector<TickResult>& results, std::ostream& out);

} // namespace spirits::game

#endif // SPIRITS_GAME_REPORT_WRITER_HPP
