/*
 * Copyright (C) 2025 The Cine developers
 *
 * This file is part of Cine.
 *
 * Cine is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Cine is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Cine.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <filesystem>
#include <iostream>
#include <iterator>
#include <stdlib.h>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "core/String.hpp"
#include "services/knowledge/IInMemoryGraphStore.hpp"
#include "services/knowledge/IInMemoryVectorIndex.hpp"
#include "services/knowledge/PropertyCatalog.hpp"
#include "services/recommendation/IRecommendationService.hpp"
#include "services/recommendation/RecommendationSettings.hpp"
#include "services/session/ISessionService.hpp"

namespace cine
{
    namespace
    {
        core::logging::Severity getLogMinSeverity(core::IConfig& config)
        {
            std::string_view minSeverity{ config.getString("log-min-severity", "info") };

            if (minSeverity == "debug")
                return core::logging::Severity::DEBUG;
            else if (minSeverity == "info")
                return core::logging::Severity::INFO;
            else if (minSeverity == "warning")
                return core::logging::Severity::WARNING;
            else if (minSeverity == "error")
                return core::logging::Severity::ERROR;
            else if (minSeverity == "fatal")
                return core::logging::Severity::FATAL;

            throw core::CineException{ "Invalid config value for 'log-min-severity'" };
        }

        std::vector<std::string_view> tokenize(std::string_view line)
        {
            std::vector<std::string_view> tokens;
            for (std::string_view token : core::stringUtils::splitString(line, ' '))
            {
                token = core::stringUtils::stringTrim(token);
                if (!token.empty())
                    tokens.push_back(token);
            }
            return tokens;
        }

        std::string getHelp()
        {
            std::string help{ "Commands:\n"
                              "\tseed <id>...\t\tadd movies you like\n"
                              "\tprefer <kind> <id>\tprefer a property value\n"
                              "\tavoid <kind> <id>\texclude a property value\n"
                              "\tyear <op> <year>\tconstrain the publication year (op is one of <, <=, =, >=, >)\n"
                              "\tyears <start> <end>\tconstrain the publication year to a range\n"
                              "\tlanguage <id>\t\tconstrain the original language\n"
                              "\tmin-rating <value>\tconstrain the minimum rating\n"
                              "\trecommend [k]\t\tget recommendations\n"
                              "\tmore [k]\t\tget more recommendations like the last ones\n"
                              "\treset\t\t\tstart over\n"
                              "\thelp\t\t\tprint this message\n"
                              "\tquit\t\t\texit\n"
                              "Property kinds:" };

            for (const knowledge::PropertyKind kind : knowledge::getAllPropertyKinds())
                help += " " + std::string{ knowledge::getPropertyKindName(kind) };

            return help;
        }

        std::string formatResult(const recommendation::RecommendationResult& result)
        {
            switch (result.status)
            {
            case recommendation::RecommendationStatus::NoSeedsOrPreferences:
                return "I can give you recommendations if you tell me a movie you like!";
            case recommendation::RecommendationStatus::NothingFound:
                return "I searched based on your preferences but couldn't find any matching movies. Try relaxing some constraints or giving me another movie you like.";
            case recommendation::RecommendationStatus::Ok:
                break;
            }

            std::string response{ "Here are a few recommendations:" };
            for (const recommendation::Recommendation& recommendation : result.recommendations)
            {
                response += "\n- " + recommendation.label + " (" + recommendation.id + "): " + recommendation.reason;
                if (recommendation.imageId)
                    response += " [" + *recommendation.imageId + "]";
            }

            if (!result.degradations.empty())
                response += "\n(some sources were unavailable, results may be incomplete)";

            return response;
        }

        class Conversation
        {
        public:
            Conversation(session::ISessionService& sessionService, const recommendation::IRecommendationService& recommendationService, session::UserId userId, std::size_t maxCount)
                : _sessionService{ sessionService }
                , _recommendationService{ recommendationService }
                , _userId{ std::move(userId) }
                , _maxCount{ maxCount }
            {
            }

            // Returns false on quit
            bool process(std::string_view line)
            {
                const std::vector<std::string_view> tokens{ tokenize(line) };
                if (tokens.empty())
                    return true;

                const std::string_view command{ tokens.front() };
                const std::vector<std::string_view> args(std::next(std::cbegin(tokens)), std::cend(tokens));

                if (command == "quit" || command == "exit")
                    return false;

                std::string response;
                try
                {
                    response = processCommand(command, args);
                }
                catch (const core::CineException& e)
                {
                    response = e.what();
                }

                std::cout << response << std::endl;

                if (command != "help")
                {
                    session::LockedSession session{ _sessionService.acquireSession(_userId) };
                    session->addTurn(std::string{ line }, response);
                }

                return true;
            }

        private:
            std::string processCommand(std::string_view command, const std::vector<std::string_view>& args)
            {
                if (command == "help")
                    return getHelp();

                if (command == "reset" || command == "clear" || (command == "start" && args.size() == 1 && args[0] == "over"))
                {
                    _sessionService.clearSession(_userId);
                    return "Ok, let's start over.";
                }

                if (command == "recommend" || command == "more")
                {
                    if (args.size() > 1)
                        throw core::CineException{ "Usage: " + std::string{ command } + " [k]" };

                    const std::size_t maxCount{ args.empty() ? _maxCount : parseValue<std::size_t>(args[0], "count") };
                    return recommend(command == "more", maxCount);
                }

                session::ParsedIntent intent;
                if (command == "seed")
                {
                    if (args.empty())
                        throw core::CineException{ "Usage: seed <id>..." };

                    for (const std::string_view id : args)
                        intent.seedEntities.emplace(id);
                }
                else if (command == "prefer" || command == "avoid")
                {
                    if (args.size() != 2)
                        throw core::CineException{ "Usage: " + std::string{ command } + " <kind> <id>" };

                    const std::optional<knowledge::PropertyKind> kind{ knowledge::parsePropertyKind(args[0]) };
                    if (!kind)
                        throw core::CineException{ "Unknown property kind '" + std::string{ args[0] } + "'" };

                    if (command == "prefer")
                        intent.preferences.emplace(*kind, std::string{ args[1] });
                    else
                        intent.negations.emplace(*kind, std::string{ args[1] });
                }
                else if (command == "year")
                {
                    if (args.size() != 2)
                        throw core::CineException{ "Usage: year <op> <year>" };

                    const std::optional<session::Comparison> comparison{ session::parseComparison(args[0]) };
                    if (!comparison)
                        throw core::CineException{ "Unknown comparison '" + std::string{ args[0] } + "'" };

                    addConstraint(intent, session::YearConstraint{ *comparison, parseValue<int>(args[1], "year") });
                }
                else if (command == "years")
                {
                    if (args.size() != 2)
                        throw core::CineException{ "Usage: years <start> <end>" };

                    addConstraint(intent, session::YearRangeConstraint{ parseValue<int>(args[0], "year"), parseValue<int>(args[1], "year") });
                }
                else if (command == "language")
                {
                    if (args.size() != 1)
                        throw core::CineException{ "Usage: language <id>" };

                    addConstraint(intent, session::LanguageConstraint{ std::string{ args[0] } });
                }
                else if (command == "min-rating")
                {
                    if (args.size() != 1)
                        throw core::CineException{ "Usage: min-rating <value>" };

                    addConstraint(intent, session::MinRatingConstraint{ parseValue<double>(args[0], "rating") });
                }
                else
                {
                    throw core::CineException{ "Unknown command '" + std::string{ command } + "', type 'help' for the list of commands" };
                }

                session::LockedSession session{ _sessionService.acquireSession(_userId) };
                session->update(intent);
                return "Noted.";
            }

            std::string recommend(bool isFollowUp, std::size_t maxCount)
            {
                session::LockedSession session{ _sessionService.acquireSession(_userId) };
                if (isFollowUp)
                    session->update(session::ParsedIntent{ .isFollowUp = true });

                const recommendation::RecommendationResult result{ _recommendationService.getRecommendations(*session, maxCount) };

                knowledge::EntitySet recommendedIds;
                for (const recommendation::Recommendation& recommendation : result.recommendations)
                    recommendedIds.insert(recommendation.id);
                session->addRecommendations(recommendedIds);

                return formatResult(result);
            }

            static void addConstraint(session::ParsedIntent& intent, const session::Constraint& constraint)
            {
                intent.constraints.emplace(session::getConstraintKind(constraint), constraint);
            }

            template<typename T>
            static T parseValue(std::string_view str, std::string_view name)
            {
                const std::optional<T> value{ core::stringUtils::readAs<T>(str) };
                if (!value)
                    throw core::CineException{ "Bad " + std::string{ name } + " '" + std::string{ str } + "'" };

                return *value;
            }

            session::ISessionService& _sessionService;
            const recommendation::IRecommendationService& _recommendationService;
            const session::UserId _userId;
            const std::size_t _maxCount;
        };
    } // namespace
} // namespace cine

int main(int argc, char* argv[])
{
    try
    {
        using namespace cine;
        namespace po = boost::program_options;

        po::options_description desc{ "Allowed options" };
        desc.add_options()("help,h", "print usage message")("conf,c", po::value<std::string>()->default_value("/etc/cine.conf"), "Cine config file")("user,u", po::value<std::string>()->default_value("local"), "User id of the conversation")("max,m", po::value<std::size_t>()->default_value(5), "Max recommendation count");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help"))
        {
            std::cout << desc << std::endl;
            return EXIT_SUCCESS;
        }

        core::Service<core::IConfig> config{ core::createConfig(vm["conf"].as<std::string>()) };
        core::Service<core::logging::ILogger> logger{ core::logging::createLogger(getLogMinSeverity(*config.get()), config->getPath("log-file", "")) };

        const std::filesystem::path graphFile{ config->getPath("graph-file", "") };
        const std::filesystem::path embeddingsFile{ config->getPath("embeddings-file", "") };
        if (graphFile.empty() || embeddingsFile.empty())
            throw core::CineException{ "'graph-file' and 'embeddings-file' must be set in the config file" };

        const knowledge::PropertyCatalog catalog{ knowledge::loadPropertyCatalog(*config.get()) };
        const recommendation::RecommendationSettings settings{ recommendation::loadRecommendationSettings(*config.get()) };

        const auto graphStore{ knowledge::createInMemoryGraphStore(catalog) };
        graphStore->load(graphFile);
        CINE_LOG(MAIN, INFO, "Graph loaded: " << graphStore->getTripleCount() << " triples");

        const auto vectorIndex{ knowledge::createInMemoryVectorIndex() };
        vectorIndex->load(embeddingsFile);
        CINE_LOG(MAIN, INFO, "Embeddings loaded: " << vectorIndex->getEmbeddingCount() << " vectors of dimension " << vectorIndex->getDimensionCount());

        const auto sessionService{ session::createSessionService() };
        const auto recommendationService{ recommendation::createRecommendationService(*graphStore, *vectorIndex, *graphStore, catalog, settings) };

        Conversation conversation{ *sessionService, *recommendationService, vm["user"].as<std::string>(), vm["max"].as<std::size_t>() };

        std::cout << "Tell me a movie you like, type 'help' for the list of commands." << std::endl;

        std::string line;
        while (std::getline(std::cin, line))
        {
            if (!conversation.process(line))
                break;
        }
    }
    catch (std::exception& e)
    {
        std::cerr << "Caught exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
