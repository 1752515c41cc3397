#include "cli.hpp"

int main() {
    return rollout::run_cli(rollout::RunKind::Update);
}
