/* USER: bob TASK: bankacc */
#include <iostream>

int main() {
  int n
  std::cin >> n;
  return 0;
}
