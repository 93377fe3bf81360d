#include "Logger.h"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using cl::logging::Level;

TEST(LoggerTest, RootLoggerWorks) {
  auto rootLogger = cl::logging::getRootLogger();
  EXPECT_NO_THROW({
    rootLogger.debug << "Debug message";
    rootLogger.info << "Info message";
    rootLogger.warning << "Warning message";
  });
}

TEST(LoggerTest, SameNameReturnsSameNode) {
  auto a = cl::logging::getLogger("same.name");
  auto b = cl::logging::getLogger("same.name");
  EXPECT_EQ(a, b);
  EXPECT_EQ(a.getFullName(), "same.name");
  EXPECT_NE(a, cl::logging::getLogger("same"));
}

TEST(LoggerTest, LevelNamesRoundTrip) {
  for (Level level : {Level::DEBUG, Level::INFO, Level::WARNING, Level::ERROR,
                      Level::CRITICAL}) {
    Level parsed = Level::DEBUG;
    ASSERT_TRUE(cl::logging::levelFromString(cl::logging::levelToString(level), parsed));
    EXPECT_EQ(parsed, level);
  }
  Level parsed = Level::DEBUG;
  EXPECT_FALSE(cl::logging::levelFromString("verbose", parsed));
}

TEST(LoggerTest, MessagesBelowLevelAreDropped) {
  auto logger = cl::logging::getLogger("level_filter");
  auto memory = std::make_shared<cl::logging::MemoryHandler>();
  logger.addHandler(memory);
  logger.setPropagate(false);
  logger.setLevel(Level::WARNING);

  logger.debug << "debug";
  logger.info << "info";
  logger.warning << "warning " << 1;
  logger.error << "error";

  auto lines = memory->getLines();
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_NE(lines[0].find("[WARNING] [level_filter] warning 1"), std::string::npos);
  EXPECT_NE(lines[1].find("[ERROR]"), std::string::npos);
}

TEST(LoggerTest, ChildInheritsParentLevel) {
  auto parent = cl::logging::getLogger("inherit");
  auto child = cl::logging::getLogger("inherit.child");
  parent.setLevel(Level::ERROR);
  EXPECT_EQ(child.getLevel(), Level::ERROR);

  child.setLevel(Level::DEBUG);
  EXPECT_EQ(child.getLevel(), Level::DEBUG);
  EXPECT_EQ(parent.getLevel(), Level::ERROR);
}

TEST(LoggerTest, MessagesPropagateToParentHandlers) {
  auto parent = cl::logging::getLogger("propagate");
  auto child = cl::logging::getLogger("propagate.child");
  auto memory = std::make_shared<cl::logging::MemoryHandler>();
  parent.addHandler(memory);
  parent.setPropagate(false);
  parent.setLevel(Level::DEBUG);

  child.info << "from child";
  auto lines = memory->getLines();
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_NE(lines[0].find("[propagate.child] from child"), std::string::npos);

  child.setPropagate(false);
  child.info << "kept local";
  EXPECT_EQ(memory->getLines().size(), 1u);
}

TEST(LoggerTest, HandlerLevelFiltersIndependently) {
  auto logger = cl::logging::getLogger("handler_level");
  auto memory = std::make_shared<cl::logging::MemoryHandler>();
  memory->setLevel(Level::ERROR);
  logger.addHandler(memory);
  logger.setPropagate(false);
  logger.setLevel(Level::DEBUG);

  logger.info << "ignored";
  logger.critical << "kept";
  auto lines = memory->getLines();
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_NE(lines[0].find("[CRITICAL]"), std::string::npos);

  memory->clear();
  EXPECT_TRUE(memory->getLines().empty());
}

TEST(LoggerTest, RemovedHandlerStopsReceiving) {
  auto logger = cl::logging::getLogger("remove_handler");
  auto kept = std::make_shared<cl::logging::MemoryHandler>();
  auto removed = std::make_shared<cl::logging::MemoryHandler>();
  logger.addHandler(kept);
  logger.addHandler(removed);
  logger.setPropagate(false);
  logger.setLevel(Level::INFO);

  logger.info << "both";
  logger.removeHandler(removed);
  logger.info << "kept only";

  EXPECT_EQ(kept->getLines().size(), 2u);
  EXPECT_EQ(removed->getLines().size(), 1u);

  // Removing an unknown handler is a no-op
  logger.removeHandler(std::make_shared<cl::logging::MemoryHandler>());
  logger.info << "still kept";
  EXPECT_EQ(kept->getLines().size(), 3u);
}

TEST(LoggerTest, FileHandlerWritesLines) {
  auto path = std::filesystem::temp_directory_path() / "civic_logger_test.log";
  std::filesystem::remove(path);

  auto logger = cl::logging::getLogger("file_test");
  logger.setPropagate(false);
  logger.setLevel(Level::INFO);
  logger.addFileHandler(path.string(), Level::DEBUG);
  logger.info << "written to file";
  logger.clearHandlers();

  std::ifstream file(path);
  std::string line;
  ASSERT_TRUE(std::getline(file, line));
  EXPECT_NE(line.find("written to file"), std::string::npos);
  std::filesystem::remove(path);
}

TEST(LoggerTest, FileHandlerThrowsForUnwritablePath) {
  auto logger = cl::logging::getLogger("file_fail");
  EXPECT_THROW(logger.addFileHandler("/nonexistent-dir/sub/file.log"), std::runtime_error);
}
