#include "platform/config_store.hpp"
#include "wheel_application.hpp"

#include <iostream>
#include <string>

int main(int argc, char* argv[])
{
  std::string config_path = argc > 1 ? argv[1] : ConfigStore::default_path();

  auto app = WheelApplication::create(config_path);
  std::string error;
  if (!app->prepare(error)) {
    std::cerr << "Error: " << error << '\n';
    return 1;
  }
  return app->run(1, argv);
}
