#include "Logger.h"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace {

class CaptureHandler : public fv::logging::Handler {
public:
    void emit(fv::logging::Level level, const std::string &message) override {
        if (level < level_) {
            return;
        }
        messages.push_back(message);
    }

    std::vector<std::string> messages;
};

bool endsWith(const std::string &text, const std::string &suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

TEST(LoggerTest, RootLoggerWorks) {
    auto rootLogger = fv::logging::getRootLogger();
    EXPECT_EQ(rootLogger.getFullName(), "");
    EXPECT_NO_THROW({
        rootLogger.info << "Info message";
        rootLogger.warning << "Warning message";
    });
}

TEST(LoggerTest, NamedLoggerHasCorrectName) {
    auto namedLogger = fv::logging::getLogger("myapp");
    EXPECT_EQ(namedLogger.getName(), "myapp");
    EXPECT_EQ(namedLogger.getFullName(), "myapp");
}

TEST(LoggerTest, SameNameReturnsSameLogger) {
    auto first = fv::logging::getLogger("same");
    auto second = fv::logging::getLogger(".same");
    EXPECT_EQ(first, second);
}

TEST(LoggerTest, HierarchicalLoggerCreatesTree) {
    auto app = fv::logging::getLogger("tree_app");
    auto engine = fv::logging::getLogger("tree_app.engine");
    auto root = fv::logging::getRootLogger();

    EXPECT_EQ(app.getParent(), root);
    EXPECT_EQ(engine.getParent(), app);
    EXPECT_EQ(engine.getName(), "engine");
    EXPECT_EQ(engine.getFullName(), "tree_app.engine");
}

TEST(LoggerTest, MissingAncestorsAreCreated) {
    auto leaf = fv::logging::getLogger("deep.middle.leaf");
    EXPECT_EQ(leaf.getParent().getFullName(), "deep.middle");
    EXPECT_EQ(leaf.getParent().getParent().getFullName(), "deep");
}

TEST(LoggerTest, MessagesCarryLevelAndOriginName) {
    auto logger = fv::logging::getLogger("capture_format");
    logger.setPropagate(false);
    auto spCapture = std::make_shared<CaptureHandler>();
    logger.addHandler(spCapture);
    logger.setLevel(fv::logging::Level::DEBUG);

    logger.info << "height=" << 3;

    ASSERT_EQ(spCapture->messages.size(), 1u);
    EXPECT_TRUE(endsWith(spCapture->messages[0], "[INFO] [capture_format] height=3"));
}

TEST(LoggerTest, LevelFiltersMessages) {
    auto logger = fv::logging::getLogger("capture_level");
    logger.setPropagate(false);
    auto spCapture = std::make_shared<CaptureHandler>();
    logger.addHandler(spCapture);
    logger.setLevel(fv::logging::Level::WARNING);

    logger.debug << "dropped";
    logger.info << "dropped";
    logger.warning << "kept";
    logger.error << "kept";

    EXPECT_EQ(logger.getLevel(), fv::logging::Level::WARNING);
    EXPECT_EQ(spCapture->messages.size(), 2u);
}

TEST(LoggerTest, ChildInheritsParentLevel) {
    auto parent = fv::logging::getLogger("inherit");
    auto child = fv::logging::getLogger("inherit.child");
    parent.setLevel(fv::logging::Level::ERROR);

    EXPECT_EQ(child.getLevel(), fv::logging::Level::ERROR);

    child.setLevel(fv::logging::Level::DEBUG);
    EXPECT_EQ(child.getLevel(), fv::logging::Level::DEBUG);
    EXPECT_EQ(parent.getLevel(), fv::logging::Level::ERROR);
}

TEST(LoggerTest, MessagesPropagateToAncestors) {
    auto parent = fv::logging::getLogger("propagate");
    auto child = fv::logging::getLogger("propagate.child");
    parent.setPropagate(false);
    child.setLevel(fv::logging::Level::DEBUG);
    auto spParentCapture = std::make_shared<CaptureHandler>();
    parent.addHandler(spParentCapture);

    child.info << "from child";
    EXPECT_EQ(spParentCapture->messages.size(), 1u);
    EXPECT_TRUE(endsWith(spParentCapture->messages[0], "[propagate.child] from child"));

    child.setPropagate(false);
    child.info << "kept local";
    EXPECT_EQ(spParentCapture->messages.size(), 1u);
}

TEST(LoggerTest, HandlerLevelFiltersIndependently) {
    auto logger = fv::logging::getLogger("handler_level");
    logger.setPropagate(false);
    logger.setLevel(fv::logging::Level::DEBUG);
    auto spAll = std::make_shared<CaptureHandler>();
    auto spErrors = std::make_shared<CaptureHandler>();
    spErrors->setLevel(fv::logging::Level::ERROR);
    logger.addHandler(spAll);
    logger.addHandler(spErrors);

    logger.debug << "one";
    logger.error << "two";

    EXPECT_EQ(spAll->messages.size(), 2u);
    EXPECT_EQ(spErrors->messages.size(), 1u);
}

TEST(LoggerTest, FileHandlerAppendsToFile) {
    std::string path = "test_logger_file.log";
    std::filesystem::remove(path);

    auto logger = fv::logging::getLogger("file_test");
    logger.setPropagate(false);
    logger.setLevel(fv::logging::Level::DEBUG);
    ASSERT_NO_THROW(logger.addFileHandler(path, fv::logging::Level::INFO));

    logger.debug << "not written";
    logger.info << "written";
    logger.clearHandlers();

    std::ifstream file(path);
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("written"), std::string::npos);
    EXPECT_EQ(content.find("not written"), std::string::npos);

    std::filesystem::remove(path);
}

TEST(LoggerTest, FileHandlerThrowsOnBadPath) {
    auto logger = fv::logging::getLogger("file_bad");
    EXPECT_THROW(logger.addFileHandler("/nonexistent_dir_fv/x.log"), std::runtime_error);
}

TEST(LoggerTest, LevelToString) {
    EXPECT_EQ(fv::logging::levelToString(fv::logging::Level::DEBUG), "DEBUG");
    EXPECT_EQ(fv::logging::levelToString(fv::logging::Level::CRITICAL), "CRITICAL");
}
