#include <TNPlanar/core/context.hpp>
#include <TNPlanar/core/expr.hpp>
#include <TNPlanar/core/logger.hpp>
#include <TNPlanar/core/utility/exception.hpp>
#include <TNPlanar/eval/executor.hpp>
#include <TNPlanar/eval/space_backend.hpp>
#include <TNPlanar/planar/compile.hpp>

#include <cstring>
#include <iostream>
#include <memory>

// compiles a small planar diagram, prints the plan and runs it against the
// space-tracking backend
// usage: planar_plan [construct|remove] [verbose]
int main(int argc, char* argv[]) {
  using namespace tnplanar;

  const bool remove = argc > 1 && std::strcmp(argv[1], "remove") == 0;
  const bool verbose = argc > 2 && std::strcmp(argv[2], "verbose") == 0;
  if (verbose) Logger::set_instance(2);

  set_default_context({.braiding_mode = remove ? BraidingMode::Remove
                                               : BraidingMode::Construct});

  // C swaps the outgoing legs of B, then D contracts C with A and H
  auto diagram = block(
      {define(tensor("C", {"a", "b"}, {"c", "d"}),
              tensor("τ", {"a", "b"}, {"e", "f"}) *
                  tensor("B", {"e", "f"}, {"c", "d"})),
       define(tensor("D", {"x"}, {"d"}),
              tensor("A", {"x"}, {"a", "b"}) * tensor("C", {"a", "b"}, {"c", "d"}) *
                  tensor("H", {"c"})),
       define(scalar("n"), conj(tensor("D", {"x"}, {"d"})) *
                               tensor("D", {"x"}, {"d"}))});

  try {
    auto plan = compile(diagram);
    std::cout << "plan (" << (remove ? "remove" : "construct")
              << " braidings):\n"
              << plan.to_string();

    const Space V1("V1"), V2("V2"), W1("W1"), W2("W2"), X("X");
    Environment env{
        {"A", std::make_shared<SpaceTensor>(SpaceList{X}, SpaceList{V2, V1})},
        {"B", std::make_shared<SpaceTensor>(SpaceList{V1, V2},
                                            SpaceList{W1, W2})},
        {"H", std::make_shared<SpaceTensor>(SpaceList{W1}, SpaceList{})}};

    SpaceBackend backend;
    env = Executor(backend).run(plan, std::move(env));

    std::cout << "results:\n";
    for (const auto& [label, value] : env)
      std::cout << "  " << label << " : " << value->to_string() << "\n";
  } catch (const Exception& ex) {
    std::cerr << "planar_plan: " << ex.what() << std::endl;
    return 1;
  }

  return 0;
}
