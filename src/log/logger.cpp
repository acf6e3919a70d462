#include "logger.hpp"
#include <fstream>
#include <iostream>
#include <mutex>
#include <ctime>
#include <sys/stat.h>
#include <unistd.h>
#include <cstdarg>   // va_list
#include <cstdio>    // vsnprintf
#include <cstring>
#include <errno.h>

namespace {
std::mutex g_mtx;
std::string g_dir = DEFAULT_LOG_DIR;
}

void Logger::setLogDir(const std::string& dir)
{
	std::lock_guard<std::mutex> lk(g_mtx);
	if (!dir.empty()) g_dir = dir;
}

std::string Logger::logDir()
{
	std::lock_guard<std::mutex> lk(g_mtx);
	return g_dir;
}

std::string Logger::logFile()
{
	return logDir() + "/" LOG_FILE_NAME;
}

void Logger::write(const std::string& message)
{
	const std::string dir = logDir();
	const std::string filePath = dir + "/" LOG_FILE_NAME;

	// 디렉토리가 없으면 생성
	if (access(dir.c_str(), F_OK) == -1) {
		if (mkdir(dir.c_str(), 0777) == -1) {
			std::cerr << "로그 디렉토리 생성 실패: " << strerror(errno) << std::endl;
			return;
		}
	}

	time_t now = time(nullptr);
	tm ltm{};
	localtime_r(&now, &ltm);

	char timeStr[32];
	strftime(timeStr, sizeof(timeStr), "%Y-%m-%d %H:%M:%S", &ltm);

	std::lock_guard<std::mutex> lk(g_mtx);
	std::ofstream logFile(filePath, std::ios::app);
	if (logFile.is_open()) {
		logFile << "[" << timeStr << "] " << message << std::endl;
	} else {
		std::cerr << "로그 파일 열기 실패: " << filePath << std::endl;
	}
}

void Logger::writef(const char* format, ...)
{
	char buffer[1024];

	va_list args;
	va_start(args, format);
	vsnprintf(buffer, sizeof(buffer), format, args);
	va_end(args);

	write(std::string(buffer));
}
