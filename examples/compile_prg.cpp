// Example: compile a JSON color sequence into a .prg program file.
#include "ltxlink/ltxlink.h"

#include <cstdlib>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "usage: " << argv[0]
              << " <sequence.json> <output.prg> [output_refresh_rate]" << std::endl;
    return 2;
  }
  const std::string input = argv[1];
  const std::string output = argv[2];

  ltxlink::SequenceProgram program;
  std::string error;
  if (!ltxlink::LoadSequenceFile(input, &program, &error)) {
    std::cerr << error << std::endl;
    return 1;
  }
  if (argc > 3) {
    const long rate = std::strtol(argv[3], nullptr, 10);
    if (rate <= 0 || rate > 0xffff) {
      std::cerr << "output refresh rate must be between 1 and 65535" << std::endl;
      return 2;
    }
    if (!ltxlink::ResampleProgram(program, static_cast<uint16_t>(rate), &program, &error)) {
      std::cerr << error << std::endl;
      return 1;
    }
  }

  std::vector<ltxlink::Segment> segments;
  ltxlink::CompiledSequence sequence;
  std::vector<uint8_t> bytes;
  if (!ltxlink::BuildSegments(program, &segments, &error) ||
      !ltxlink::CompileSequence(segments, program.pixel_count, program.refresh_rate,
                                &sequence, &error) ||
      !ltxlink::EncodeSequence(sequence, &bytes, &error) ||
      !ltxlink::WriteProgramFile(output, bytes, &error)) {
    std::cerr << error << std::endl;
    return 1;
  }

  std::cout << "Wrote " << output << ": " << bytes.size() << " bytes, "
            << sequence.segments.size() << " segments at " << sequence.refresh_rate
            << " ticks/s" << std::endl;
  return 0;
}
