#include <catch2/catch_all.hpp>

#include "Logging/Logging.h"
#include "Logging/MetadataFormatter.h"

#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace spim {
namespace logging {

namespace {

typedef std::pair<internal::PacketState, std::string> Line;

PacketArray MakeEntry(const std::string& text,
      const std::string& component = "Session", LogLevel level = LogLevelInfo)
{
   StampData stampData;
   stampData.Stamp();
   PacketArray array;
   array.AppendEntry(LoggerData(component.c_str()), EntryData(level),
         stampData, text.c_str());
   return array;
}

std::vector<Line> Split(const std::string& text)
{
   PacketArray array = MakeEntry(text);
   std::vector<Line> lines;
   for (auto it = array.Begin(); it != array.End(); ++it)
      lines.push_back(Line(it->GetPacketState(), it->GetText()));
   return lines;
}

const internal::PacketState First = internal::PacketStateEntryFirstLine;
const internal::PacketState NewLine = internal::PacketStateNewLine;
const internal::PacketState Cont = internal::PacketStateLineContinuation;

} // anonymous namespace

TEST_CASE("trailing line breaks are dropped", "[Logging]")
{
   const char* reply = GENERATE(":A", ":A\r", ":A\n", ":A\r\n", ":A\n\n",
         ":A\r\n\r\n");
   CHECK(Split(reply) == std::vector<Line>{ Line(First, ":A") });
}

TEST_CASE("entries with only line breaks give one empty line", "[Logging]")
{
   const char* text = GENERATE("", "\r", "\n", "\r\n", "\n\r\n");
   CHECK(Split(text) == std::vector<Line>{ Line(First, "") });
}

TEST_CASE("each CR, LF or CRLF starts a new line", "[Logging]")
{
   const char* text = GENERATE("33NR X=10\r:A", "33NR X=10\n:A",
         "33NR X=10\r\n:A", "33NR X=10\n:A\r\n");
   CHECK(Split(text) == std::vector<Line>{
         Line(First, "33NR X=10"), Line(NewLine, ":A") });
}

TEST_CASE("blank lines inside an entry are kept", "[Logging]")
{
   const char* text = GENERATE("A\n\nB", "A\r\rB", "A\r\n\r\nB", "A\n\r\nB");
   CHECK(Split(text) == std::vector<Line>{
         Line(First, "A"), Line(NewLine, ""), Line(NewLine, "B") });

   CHECK(Split("\nB") == std::vector<Line>{
         Line(First, ""), Line(NewLine, "B") });
}

TEST_CASE("long lines are soft split", "[Logging]")
{
   const std::size_t maxLen = internal::GenericLinePacket<Metadata>::PacketTextLen;

   CHECK(Split(std::string(maxLen, 'x')).size() == 1);

   const std::size_t extra = GENERATE(std::size_t(1), std::size_t(17));
   const std::string longLine(2 * maxLen + extra, 'x');
   CHECK(Split(longLine) == std::vector<Line>{
         Line(First, std::string(maxLen, 'x')),
         Line(Cont, std::string(maxLen, 'x')),
         Line(Cont, std::string(extra, 'x')) });
}

TEST_CASE("standard format prefixes every line", "[Logging]")
{
   internal::MetadataFormatter formatter;
   std::ostringstream out;

   PacketArray array = MakeEntry("Programming failed\n33NV X=10 -> :N-4",
         "Programmer", LogLevelError);
   array.Append(MakeEntry("Run 1 ended", "Engine", LogLevelInfo));
   internal::WriteLinesToStreamWithStandardFormat(out, array.Begin(),
         array.End(), formatter);

   std::vector<std::string> lines;
   std::istringstream in(out.str());
   for (std::string line; std::getline(in, line); )
      lines.push_back(line);
   REQUIRE(lines.size() == 3);

   const std::string::size_type open = lines[0].find(" [ERR,Programmer] ");
   REQUIRE(open != std::string::npos);
   CHECK(lines[0].find(" tid") != std::string::npos);
   CHECK(lines[0].substr(open + 18) == "Programming failed");

   // Continuation lines carry only the brackets, aligned with the first
   CHECK(lines[1].substr(0, open + 1) == std::string(open + 1, ' '));
   CHECK(lines[1].substr(open + 1) ==
         "[" + std::string(14, ' ') + "] 33NV X=10 -> :N-4");

   CHECK_THAT(lines[2], Catch::Matchers::EndsWith(" [IFO,Engine] Run 1 ended"));
}

TEST_CASE("soft split lines are joined when formatted", "[Logging]")
{
   const std::size_t maxLen = internal::GenericLinePacket<Metadata>::PacketTextLen;
   const std::string text(maxLen + 5, 'y');

   internal::MetadataFormatter formatter;
   std::ostringstream out;
   PacketArray array = MakeEntry(text);
   internal::WriteLinesToStreamWithStandardFormat(out, array.Begin(),
         array.End(), formatter);

   CHECK_THAT(out.str(), Catch::Matchers::EndsWith("[IFO,Session] " + text + "\n"));
}

} // namespace logging
} // namespace spim
