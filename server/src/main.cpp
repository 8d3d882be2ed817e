/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 */
#include <exception>
#include <iostream>

#include "arena/app.hpp"

int main() {
  using namespace arena;
  try {
    AppConfig config = LoadConfigFromEnv();
    ServerApp app(config);
    app.Run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
