#include <QCommandLineParser>
#include <QCoreApplication>
#include <QGuiApplication>
#include <QStringList>

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "ClipboardController.hpp"
#include "ClipboardReport.hpp"
#include "ClipboardReportUtils.hpp"
#include "ClipboardSettings.hpp"
#include "ClipboardTransport.hpp"
#include "Config.hpp"
#include "ObjSceneIO.hpp"
#include "Scene.hpp"
#include "SceneMesh.hpp"
#include "SysMesh.hpp"

namespace
{
    struct CommandLine
    {
        QString                             command;
        std::filesystem::path               input;
        std::filesystem::path               output;
        std::filesystem::path               settingsPath = ClipboardSettings::defaultSettingsPath();
        std::optional<TransportMode>        transport;
        std::optional<CoordinateConvention> exchange;
        CoordinateConvention                hostConvention = CoordinateConvention::RH_Yup;
        QStringList                         groups;
        bool                                whole = false;
    };

    std::filesystem::path toPath(const QString& s)
    {
        return std::filesystem::path(s.toStdString());
    }

    bool parseCommandLine(const QStringList& arguments, CommandLine& cl, QString& help)
    {
        QCommandLineParser parser;
        parser.setApplicationDescription("Copy and paste meshes between OBJ files through the mesh clipboard.");
        parser.addHelpOption();
        parser.addPositionalArgument("command", "copy | cut | paste | new | settings");
        parser.addPositionalArgument("file", "OBJ file to read (copy, cut, paste) or write (new).");

        const QCommandLineOption outputOpt({"o", "output"}, "Write the edited mesh here instead of over <file>.", "path");
        const QCommandLineOption groupOpt({"g", "group"}, "Copy the polygons of this OBJ group (repeatable).", "name");
        const QCommandLineOption wholeOpt("whole", "Copy the whole mesh, ignoring any selection.");
        const QCommandLineOption transportOpt("transport", "Transport for this run: TemporaryFile or OSClipboard.",
                                              "mode");
        const QCommandLineOption conventionOpt("convention", "Convention written by copy/cut: RH_Yup or LH_Zup.",
                                               "name");
        const QCommandLineOption hostOpt("host-convention", "Convention of the OBJ files (default RH_Yup).", "name");
        const QCommandLineOption settingsOpt("settings", "Settings file to read and write.", "path");

        parser.addOptions({outputOpt, groupOpt, wholeOpt, transportOpt, conventionOpt, hostOpt, settingsOpt});

        help = parser.helpText();

        if (!parser.parse(arguments))
        {
            std::cerr << parser.errorText().toStdString() << '\n';
            return false;
        }
        if (parser.isSet("help"))
            return false;

        const QStringList positional = parser.positionalArguments();
        if (positional.isEmpty())
        {
            std::cerr << "missing command\n";
            return false;
        }

        cl.command = positional.front();
        if (positional.size() > 1)
            cl.input = toPath(positional.at(1));
        cl.output = parser.isSet(outputOpt) ? toPath(parser.value(outputOpt)) : cl.input;
        cl.groups = parser.values(groupOpt);
        cl.whole  = parser.isSet(wholeOpt);

        if (parser.isSet(settingsOpt))
            cl.settingsPath = toPath(parser.value(settingsOpt));

        if (parser.isSet(transportOpt))
        {
            cl.transport = parseTransportMode(parser.value(transportOpt).toStdString());
            if (!cl.transport)
            {
                std::cerr << "unknown transport " << parser.value(transportOpt).toStdString() << '\n';
                return false;
            }
        }

        if (parser.isSet(conventionOpt))
        {
            cl.exchange = parseConvention(parser.value(conventionOpt).toStdString());
            if (!cl.exchange)
            {
                std::cerr << "unknown convention " << parser.value(conventionOpt).toStdString() << '\n';
                return false;
            }
        }

        if (parser.isSet(hostOpt))
        {
            const auto host = parseConvention(parser.value(hostOpt).toStdString());
            if (!host)
            {
                std::cerr << "unknown convention " << parser.value(hostOpt).toStdString() << '\n';
                return false;
            }
            cl.hostConvention = *host;
        }

        return true;
    }

    /// Selects the polygons of the named OBJ groups. @return Number of polygons selected.
    size_t selectGroups(SysMesh& mesh, const QStringList& groups)
    {
        size_t selected = 0;
        for (const QString& group : groups)
        {
            const int32_t map = mesh.map_find(SysMapType::PolyPick, group.toStdString());
            if (map < 0)
            {
                std::cerr << "no group named " << group.toStdString() << '\n';
                continue;
            }
            for (int32_t poly : mesh.map_polys(map))
            {
                if (mesh.select_poly(poly, true))
                    ++selected;
            }
        }
        return selected;
    }

    int runSettings(const CommandLine& cl, ClipboardSettings& settings, ClipboardReport& report)
    {
        if (cl.transport)
            settings.transportMode = *cl.transport;

        if (cl.transport && !saveClipboardSettings(cl.settingsPath, settings, report))
        {
            dumpClipboardReport(report);
            return 1;
        }

        std::cout << "settings:      " << cl.settingsPath.string() << '\n'
                  << "transportMode: " << transportModeName(settings.transportMode) << '\n';
        return 0;
    }

    int runOperation(const CommandLine& cl, const ClipboardSettings& settings, ClipboardReport& report)
    {
        ClipboardOperation operation{};
        if (cl.command == "copy")
            operation = ClipboardOperation::Copy;
        else if (cl.command == "cut")
            operation = ClipboardOperation::Cut;
        else if (cl.command == "paste")
            operation = ClipboardOperation::Paste;
        else if (cl.command == "new")
            operation = ClipboardOperation::NewMesh;
        else
        {
            std::cerr << "unknown command " << cl.command.toStdString() << '\n';
            return 2;
        }

        if (cl.input.empty())
        {
            std::cerr << cl.command.toStdString() << " needs a file\n";
            return 2;
        }

        std::unique_ptr<ClipboardTransport> transport = config::createTransport(settings, report);
        if (!transport)
        {
            dumpClipboardReport(report);
            return 1;
        }

        Scene scene(cl.hostConvention);

        if (operation != ClipboardOperation::NewMesh)
        {
            SceneMesh* mesh = loadObjIntoScene(scene, cl.input);
            if (!mesh)
            {
                std::cerr << "could not load " << cl.input.string() << '\n';
                return 1;
            }

            if (!cl.groups.isEmpty() && selectGroups(*mesh->sysMesh(), cl.groups) == 0)
                std::cerr << "the requested groups are empty; the whole mesh is used\n";
        }

        ClipboardOptions options;
        options.selectionMode      = cl.whole ? SelectionMode::WholeMesh : SelectionMode::SelectedPolygons;
        options.exchangeConvention = cl.exchange;
        options.indent             = 2;

        ClipboardController controller(*transport, options);
        const bool          ok = controller.run(operation, scene, report);
        dumpClipboardReport(report);
        if (!ok)
            return 1;

        if (operation == ClipboardOperation::Copy)
            return 0;

        SceneMesh* result = scene.activeSceneMesh();
        if (!result || !saveSceneMeshToObj(scene, *result, cl.output))
        {
            std::cerr << "could not write " << cl.output.string() << '\n';
            return 1;
        }
        std::cout << "wrote " << cl.output.string() << '\n';
        return 0;
    }
} // namespace

int main(int argc, char* argv[])
{
    QStringList arguments;
    for (int i = 0; i < argc; ++i)
        arguments << QString::fromLocal8Bit(argv[i]);

    CommandLine cl;
    QString     help;
    if (!parseCommandLine(arguments, cl, help))
    {
        std::cout << help.toStdString();
        return 2;
    }

    ClipboardReport   report;
    ClipboardSettings settings;
    if (!loadClipboardSettings(cl.settingsPath, settings, report))
    {
        dumpClipboardReport(report);
        return 1;
    }

    if (cl.command == "settings")
        return runSettings(cl, settings, report);

    if (cl.transport)
        settings.transportMode = *cl.transport;

    // QClipboard needs a GUI application; the file transport runs headless
    std::unique_ptr<QCoreApplication> app;
    if (settings.transportMode == TransportMode::OSClipboard)
        app = std::make_unique<QGuiApplication>(argc, argv);
    else
        app = std::make_unique<QCoreApplication>(argc, argv);

    return runOperation(cl, settings, report);
}
