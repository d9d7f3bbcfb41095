#include "callsheet/patterns.hpp"

#include <initializer_list>
#include <iterator>
#include <utility>

namespace callsheet {

    namespace detail {

        constexpr auto icase_flags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

        static std::regex ci(const char* pattern) {
            return std::regex{pattern, icase_flags};
        }

        static term_pattern term(const char* label, const char* pattern) {
            return term_pattern{label, ci(pattern)};
        }

        static cinematic_pattern cinematic(
                const char* name,
                std::initializer_list<const char*> triggers,
                const char* production_note,
                const char* camera_note) {
            cinematic_pattern out{};
            out.name = name;
            for (auto* t : triggers) {
                out.triggers.push_back(ci(t));
            }
            out.production_note = production_note;
            out.camera_note = camera_note;
            return out;
        }

        static void add_scene_structure(pattern_library& lib) {
            lib.scene_marker =
                    ci(R"(^\s*(?:scene|scène|escena|szene|sc\.?|مشهد|المشهد)\s*(?:#|no\.?|رقم)?\s*)"
                       R"(((?:\d|٠|١|٢|٣|٤|٥|٦|٧|٨|٩|۰|۱|۲|۳|۴|۵|۶|۷|۸|۹)+)(.*)$)");
            lib.dialogue_cue = ci(R"(^\s*([^:\n]{1,40}):)");
            lib.stage_direction = std::regex{
                    R"(\b([A-Z][A-Za-z'\-]+(?:\s+[A-Z][A-Za-z'\-]+){0,2})\s+(?:enters|exits|leaves|sits|stands|walks|runs|arrives|returns)\b)",
                    std::regex::ECMAScript | std::regex::optimize};
            lib.stage_direction_localized = ci(R"((?:يدخل|يخرج|يجلس|تدخل|تخرج|تجلس)\s+(\S+))");

            lib.interior = ci(R"((?:^|[^a-z])(?:int|interior|int/ext|i/e)(?:[^a-z]|$)|داخلي|داخلى)");
            lib.exterior = ci(R"((?:^|[^a-z])(?:ext|exterior|ext/int)(?:[^a-z]|$)|خارجي|خارجى)");
            lib.night = ci(R"(\b(?:night|evening|dusk|midnight)\b|ليل|مساء)");
            lib.day = ci(R"(\b(?:day|morning|afternoon|dawn|noon)\b|نهار|صباح)");
        }

        static void add_scene_type_vocabulary(pattern_library& lib) {
            lib.conflict =
                    ci(R"(\b(?:argue|argues|arguing|shouts?|shouting|yells?|threatens?|accuses?|confronts?|fights?|angrily|demands?|slams)\b|يصرخ|تصرخ|يهدد|تهدد|غاضب|غاضبة|بحدة|يتشاجر|تتشاجر)");
            lib.discovery =
                    ci(R"(\b(?:finds|discovers|notices|spots|uncovers|realizes)\b|يجد|تجد|يكتشف|تكتشف|يلاحظ|تلاحظ)");
            lib.emotion =
                    ci(R"(\b(?:cries|crying|tears|sobs|anxious|worried|afraid|scared|nervous|sad|grief|frustrated|angry|furious|shocked|happy|smiles|laughs)\b|تبكي|يبكي|دموع|قلق|قلقة|خائف|خائفة|حزين|حزينة|محبط|محبطة|سعيد|سعيدة)");

            lib.action_verbs = {
                    term("enters", R"(\benters\b|يدخل|تدخل)"),
                    term("exits", R"(\b(?:exits|leaves)\b|يخرج|تخرج)"),
                    term("runs", R"(\bruns\b|يركض|تركض|يجري|تجري)"),
                    term("walks", R"(\bwalks\b|يمشي|تمشي|يسير|تسير)"),
                    term("drives", R"(\bdrives\b|يقود|تقود)"),
                    term("jumps", R"(\bjumps\b|يقفز|تقفز)"),
                    term("grabs", R"(\b(?:grabs|snatches)\b|يمسك|تمسك|يخطف|تخطف)"),
                    term("opens", R"(\bopens\b|يفتح|تفتح)"),
                    term("closes", R"(\b(?:closes|shuts)\b|يغلق|تغلق)"),
                    term("pushes", R"(\bpushes\b|يدفع|تدفع)"),
                    term("climbs", R"(\bclimbs\b|يتسلق|تتسلق)"),
                    term("searches", R"(\bsearches\b|يبحث|تبحث|يفتش|تفتش)"),
                    term("sits", R"(\bsits\b|يجلس|تجلس)"),
                    term("picks up", R"(\b(?:picks up|takes)\b|يأخذ|تأخذ|يلتقط|تلتقط)")};
        }

        static void add_item_vocabulary(pattern_library& lib) {
            lib.items = {
                    // vehicles
                    term("car", R"(\bcars?\b)"),
                    term("taxi", R"(\b(?:taxi|cab)s?\b)"),
                    term("bus", R"(\bbus(?:es)?\b)"),
                    term("truck", R"(\btrucks?\b)"),
                    term("van", R"(\bvans?\b)"),
                    term("motorcycle", R"(\bmotor(?:cycle|bike)s?\b)"),
                    term("bicycle", R"(\b(?:bicycle|bike)s?\b)"),
                    term("boat", R"(\bboats?\b)"),
                    term("ambulance", R"(\bambulances?\b)"),
                    term("helicopter", R"(\bhelicopters?\b)"),
                    term("سيارة", R"(سيارة)"),
                    term("تاكسي", R"(تاكسي)"),
                    term("حافلة", R"(حافلة|أتوبيس|اتوبيس)"),
                    term("ميكروباص", R"(ميكروباص)"),
                    term("موتوسيكل", R"(موتوسيكل|دراجة نارية)"),
                    term("قارب", R"(قارب|مركب)"),
                    // ambiguous mobility aid
                    term("wheelchair", R"(\bwheel ?chairs?\b)"),
                    term("كرسي متحرك", R"(كرسي متحرك|كرسي مدولب)"),
                    // portable props
                    term("phone", R"(\b(?:cell ?phone|smartphone|phone|mobile)s?\b)"),
                    term("envelope", R"(\benvelopes?\b)"),
                    term("letter", R"(\bletters?\b)"),
                    term("laptop", R"(\blaptops?(?: computers?)?\b)"),
                    term("computer", R"(\bcomputers?\b)"),
                    term("handbag", R"(\b(?:hand)?bags?\b|\bpurses?\b)"),
                    term("briefcase", R"(\bbriefcases?\b)"),
                    term("suitcase", R"(\bsuitcases?\b)"),
                    term("cup", R"(\b(?:cup|mug)s?\b)"),
                    term("keys", R"(\bkeys?\b)"),
                    term("glasses", R"(\b(?:eye)?glasses\b)"),
                    term("wristwatch", R"(\bwrist ?watch(?:es)?\b)"),
                    term("gun", R"(\b(?:gun|pistol|revolver)s?\b)"),
                    term("knife", R"(\bknife\b|\bknives\b)"),
                    term("pen", R"(\bpens?\b)"),
                    term("book", R"(\bbooks?\b)"),
                    term("magazines", R"(\bmagazines?\b)"),
                    term("newspaper", R"(\bnewspapers?\b)"),
                    term("photograph", R"(\b(?:photo|photograph)s?\b)"),
                    term("cassette", R"(\bcassettes?(?: player)?\b)"),
                    term("radio", R"(\bradios?\b)"),
                    term("documents", R"(\b(?:document|folder|contract)s?\b)"),
                    term("hand mirror", R"(\b(?:hand|compact) mirrors?\b)"),
                    term("cigarette", R"(\bcigarettes?\b)"),
                    term("lighter", R"(\blighters?\b)"),
                    term("flowers", R"(\b(?:flowers|bouquet)\b)"),
                    term("camera", R"(\bcameras?\b)"),
                    term("wallet", R"(\bwallets?\b)"),
                    term("ظرف", R"(ظرف|مظروف)"),
                    term("هاتف", R"(هاتف|موبايل|تليفون|جوال)"),
                    term("لابتوب", R"(لابتوب|حاسب آلي|كمبيوتر)"),
                    term("حقيبة", R"(حقيبة|شنطة)"),
                    term("مجلات", R"(مجلات|مجلة)"),
                    term("كاسيت", R"(كاسيت)"),
                    term("صورة", R"(صورة|صور فوتوغرافية)"),
                    term("مفاتيح", R"(مفاتيح|مفتاح)"),
                    term("نظارة", R"(نظارة)"),
                    term("مسدس", R"(مسدس)"),
                    term("سكين", R"(سكين)"),
                    term("فنجان", R"(فنجان|كوب)"),
                    // set dressing
                    term("chair", R"(\bchairs?\b)"),
                    term("table", R"(\btables?\b)"),
                    term("desk", R"(\bdesks?\b)"),
                    term("mirror", R"(\bmirrors?\b)"),
                    term("bed", R"(\bbeds?\b)"),
                    term("closet", R"(\b(?:closet|cabinet|wardrobe)s?\b)"),
                    term("shelves", R"(\b(?:shelf|shelves|bookcase)\b)"),
                    term("painting", R"(\bpaintings?\b)"),
                    term("curtains", R"(\bcurtains?\b)"),
                    term("sofa", R"(\b(?:sofa|couch)(?:es|s)?\b)"),
                    term("lamp", R"(\blamps?\b)"),
                    term("television", R"(\b(?:television|tv)s?\b)"),
                    term("rug", R"(\b(?:rug|carpet)s?\b)"),
                    term("clock", R"(\bclocks?\b)"),
                    term("مرآة", R"(مرآة|مراية)"),
                    term("كرسي", R"(كرسي)"),
                    term("طاولة", R"(طاولة|ترابيزة)"),
                    term("سرير", R"(سرير)"),
                    term("خزانة", R"(خزانة|دولاب)"),
                    term("ستارة", R"(ستارة|ستائر)"),
                    term("كنبة", R"(كنبة|أريكة)"),
                    term("مصباح", R"(مصباح|أباجورة)"),
                    term("تلفزيون", R"(تلفزيون|تليفزيون)")};

            ambiguous_item wheelchair{};
            wheelchair.label = "wheelchair";
            wheelchair.vehicle_indicators = {
                    ci(R"(\bpush|يدفع|تدفع|دفع)"),
                    ci(R"(\bstreets?\b|شارع)"),
                    ci(R"(\bspeed|بسرعة|سرعة)"),
                    ci(R"(\broads?\b|طريق)"),
                    ci(R"(\broll(?:s|ing)?\b|يتحرك|تتحرك)"),
                    ci(R"(\b(?:race|races|racing|chase|chases)\b|مطاردة|يسابق)")};
            wheelchair.stationary_indicators = {
                    ci(R"(\bmedical\b|طبي)"),
                    ci(R"(\bpatients?\b|مريض|مريضة)"),
                    ci(R"(\bsit(?:s|ting)?\b|\bseated\b|يجلس|تجلس|جالس)"),
                    ci(R"(\bparaly|مشلول|شلل)"),
                    ci(R"(\bdisab|إعاقة|اعاقة|عاجز)"),
                    ci(R"(\bhospital\b|مستشفى)"),
                    ci(R"(\bnurses?\b|ممرضة)")};
            lib.ambiguous_items.push_back(wheelchair);

            ambiguous_item localized = lib.ambiguous_items.front();
            localized.label = "كرسي متحرك";
            lib.ambiguous_items.push_back(std::move(localized));

            lib.vehicles_taxonomy =
                    ci(R"(\b(?:car|taxi|bus|truck|van|motorcycle|bicycle|boat|ambulance|helicopter)\b|سيارة|تاكسي|حافلة|ميكروباص|موتوسيكل|قارب)");
            lib.props_taxonomy =
                    ci(R"(\b(?:phone|envelope|letter|laptop|computer|handbag|briefcase|suitcase|cup|keys|glasses|wristwatch|gun|knife|pen|book|magazines|newspaper|photograph|cassette|radio|documents|hand mirror|cigarette|lighter|flowers|camera|wallet)\b|ظرف|هاتف|لابتوب|حقيبة|مجلات|كاسيت|صورة|مفاتيح|نظارة|مسدس|سكين|فنجان)");
            lib.set_dressing_taxonomy =
                    ci(R"(\b(?:chair|table|desk|mirror|bed|closet|shelves|painting|curtains|sofa|lamp|television|rug|clock)\b|مرآة|كرسي|طاولة|مكتب|سرير|خزانة|ستارة|كنبة|مصباح|تلفزيون)");
        }

        static void add_effects_vocabulary(pattern_library& lib) {
            lib.effects = {
                    term("explosion", R"(\bexplo(?:sion|sions|des|ded|ding)\b|انفجار|تفجير)"),
                    term("fire", R"(\b(?:fire|flames|blaze|burning)\b|حريق|نيران|لهب)"),
                    term("smoke", R"(\bsmok(?:e|y|ing)\b|دخان)"),
                    term("gunfire", R"(\b(?:gunfire|gunshots?|shoots)\b|إطلاق نار|اطلاق نار)"),
                    term("blood", R"(\b(?:blood|bloody|bleeding)\b|دماء|نزيف|ينزف|تنزف)"),
                    term("rain", R"(\brain(?:s|ing|y)?\b|مطر|أمطار|امطار)"),
                    term("snow", R"(\bsnow(?:s|ing|y)?\b|ثلج|ثلوج)"),
                    term("wind", R"(\b(?:wind|windy|storm|gusts?)\b|رياح|عاصفة)"),
                    term("fog", R"(\b(?:fog|foggy|mist)\b|ضباب)"),
                    term("lightning", R"(\blightning\b|برق)"),
                    term("screen playback", R"(\b(?:screen|monitor|television|tv)s?\b|شاشة|تلفزيون|تليفزيون)")};

            lib.sound_cues = {
                    term("music", R"(\b(?:music|songs?|sings|singing|radio|cassette|soundtrack)\b|موسيقى|أغنية|اغنية|يغني|تغني|كاسيت|راديو)"),
                    term("door knock", R"(\bknock(?:s|ing)?\b|يطرق|تطرق|طرق على الباب)"),
                    term("phone ring", R"(\b(?:rings|ringing|ringtone)\b|يرن|رنين)"),
                    term("vehicle engine", R"(\b(?:engine|drives|driving|revs)\b|محرك|يقود|تقود)"),
                    term("car horn", R"(\b(?:horn|honks?|honking)\b|كلاكس|بوق)"),
                    term("footsteps", R"(\bfootsteps\b|خطوات)"),
                    term("gunshot", R"(\b(?:gunshots?|shoots|shot)\b|طلقة|رصاص)"),
                    term("scream", R"(\bscream(?:s|ing)?\b|صرخة|يصرخ|تصرخ)"),
                    term("thunder", R"(\bthunder\b|رعد)")};

            lib.stunts = {
                    term("chase", R"(\bchas(?:e|es|ing)\b|مطاردة)"),
                    term("fall", R"(\b(?:falls|tumbles)\b|يسقط|تسقط)"),
                    term("jump", R"(\bjump(?:s|ing)?\b|يقفز|تقفز)"),
                    term("fight", R"(\b(?:fight|fights|punch(?:es)?|brawl)\b|عراك|شجار|يضرب|تضرب)"),
                    term("crash", R"(\bcrash(?:es|ed)?\b|اصطدام|تصادم)")};

            lib.crowds = {
                    term("crowd", R"(\bcrowds?\b|حشد|جمهور)"),
                    term("passers-by", R"(\bpassers-?by\b|\bpedestrians\b|مارة|المارة)"),
                    term("guests", R"(\bguests\b|ضيوف|المدعوين)"),
                    term("students", R"(\bstudents\b|طلاب|طالبات)"),
                    term("police officers", R"(\b(?:police officers|policemen|cops)\b|عساكر|رجال الشرطة)"),
                    term("customers", R"(\b(?:customers|diners|patrons)\b|زبائن)"),
                    term("office staff", R"(\b(?:employees|staff|workers)\b|موظفين|موظفون)")};

            lib.speech = ci(R"(\b(?:says|talks|speaks|whispers|tells|asks|replies)\b|يقول|تقول|يتحدث|تتحدث|يهمس|تهمس)");
            lib.music_keywords =
                    ci(R"(\b(?:sings?|singing|songs?|soundtrack|music|cassette|radio)\b|يغني|تغني|أغنية|اغنية|أغاني|اغاني|موسيقى|كاسيت)");
            lib.sensitive_institutions =
                    ci(R"(\b(?:state security|intelligence agency|ministry of interior)\b|أمن الدولة|امن الدولة|المخابرات|وزارة الداخلية)");
        }

        static void add_synopsis_vocabulary(pattern_library& lib) {
            lib.discovery_verbs = {
                    term("discovers", R"(\b(?:discovers|uncovers)\b|يكتشف|تكتشف)"),
                    term("finds", R"(\bfinds\b|يجد|تجد)"),
                    term("notices", R"(\b(?:notices|spots|realizes)\b|يلاحظ|تلاحظ)")};

            lib.discovered_objects = {
                    term("an envelope", R"(\benvelopes?\b|ظرف|مظروف)"),
                    term("a letter", R"(\bletters?\b|رسالة|خطاب)"),
                    term("a photograph", R"(\b(?:photo|photograph|picture)s?\b|صورة)"),
                    term("a phone", R"(\b(?:phone|mobile)s?\b|هاتف|موبايل)"),
                    term("a laptop", R"(\b(?:laptop|computer)s?\b|لابتوب|كمبيوتر)"),
                    term("a document", R"(\b(?:document|file|contract)s?\b|مستند|ملف|عقد)"),
                    term("a key", R"(\bkeys?\b|مفتاح)"),
                    term("a note", R"(\bnotes?\b|ورقة|ملاحظة)")};

            lib.location_details = {
                    term("on the desk", R"(\bon the desk\b|على المكتب)"),
                    term("in the drawer", R"(\bin (?:a|the) drawer\b|في الدرج)"),
                    term("on the table", R"(\bon the table\b|على الطاولة|على الترابيزة)"),
                    term("in the bag", R"(\bin (?:the|his|her) bag\b|في الحقيبة|في الشنطة)"),
                    term("on the floor", R"(\bon the floor\b|على الأرض|على الارض)"),
                    term("under the bed", R"(\bunder the bed\b|تحت السرير)")};

            lib.emotions = {
                    term("deep anxiety", R"(\b(?:anxious|worried|nervous|uneasy)\b|قلق|قلقة|متوتر|متوترة)"),
                    term("fear", R"(\b(?:afraid|scared|terrified)\b|خائف|خائفة|مرعوب)"),
                    term("grief", R"(\b(?:cries|crying|tears|sobs|sad|grief)\b|تبكي|يبكي|دموع|حزين|حزينة)"),
                    term("frustration", R"(\bfrustrat(?:ed|ion)\b|محبط|محبطة|إحباط)"),
                    term("anger", R"(\b(?:angry|furious|rage)\b|غاضب|غاضبة|غضب)"),
                    term("shock", R"(\b(?:shocked|stunned|surprised)\b|مصدوم|مصدومة|صدمة|مندهش)"),
                    term("joy", R"(\b(?:happy|smiles|laughs|joy)\b|سعيد|سعيدة|تبتسم|يبتسم|يضحك|تضحك)")};

            lib.topics = {
                    term("work and career", R"(\b(?:film|movie|series|role|career|job|work|show)\b|فيلم|مسلسل|دور|شغل|عمل)"),
                    term("a celebration", R"(\b(?:party|wedding|birthday|celebration)\b|حفلة|فرح|عيد)"),
                    term("money", R"(\b(?:money|debt|pay|loan|rent)\b|فلوس|دين|مال|إيجار)"),
                    term("the investigation", R"(\b(?:police|arrest|crime|murder|evidence)\b|شرطة|جريمة|قتل|تحقيق)"),
                    term("their relationship", R"(\b(?:love|marriage|divorce|husband|wife)\b|حب|زواج|طلاق)"),
                    term("a health crisis", R"(\b(?:sick|hospital|doctor|surgery)\b|مرض|مستشفى|طبيب|عملية)")};
        }

        static void add_cinematic_patterns(pattern_library& lib) {
            lib.cinematic = {
                    cinematic("power_confrontation",
                              {R"(\b(?:desk|office)\b|مكتب)",
                               R"(\b(?:stands?|standing|rises|looms)\b|يقف|تقف|واقف|واقفة)",
                               R"(\b(?:stern|sharp|firm|cold|coldly)\b|صارم|صارمة|بحدة|حاد|حادة)"},
                              "Power dynamic: stage the dominant character above eye line",
                              "Low angle on the dominant character, over-the-shoulder on the reply"),
                    cinematic("discovery_moment",
                              {R"(\b(?:finds|discovers|notices|spots|uncovers)\b|يجد|تجد|يكتشف|تكتشف|يلاحظ|تلاحظ)",
                               R"(\b(?:envelope|letter|photo|photograph|document|note)s?\b|ظرف|رسالة|صورة|ورقة)",
                               R"(\b(?:stares|frozen|freezes|shocked|gasps)\b|يحدق|تحدق|مصدوم|مصدومة|تتجمد)"},
                              "Reveal beat: hold on the discovered object before the reaction",
                              "Slow push-in ending on an insert of the object"),
                    cinematic("phone_conversation",
                              {R"(\b(?:phone|mobile|cellphone)s?\b|هاتف|موبايل|تليفون)",
                               R"(\b(?:calls|answers|dials|rings|hangs up)\b|يتصل|تتصل|يرد|ترد|يرن)",
                               R"(\b(?:hello|voice|line|speaker)\b|ألو|الو|صوت)"},
                              "Phone call: record the off-screen voice for playback on set",
                              "Medium close-up, consider split screen for both ends"),
                    cinematic("music_cue",
                              {R"(\b(?:music|songs?|sings|cassette|radio)\b|موسيقى|أغنية|اغنية|يغني|تغني|كاسيت)",
                               R"(\b(?:plays|listens|turns on|hums)\b|يشغل|تشغل|يستمع|تستمع|يدندن|تدندن)",
                               R"(\b(?:volume|melody|loud|softly)\b|صوت عال|لحن|بهدوء)"},
                              "Music cue: confirm source track and clearance before the shoot day",
                              "Insert on the playback device, then wide for the reaction"),
                    cinematic("vehicle_scene",
                              {R"(\b(?:car|taxi|bus|truck|van)s?\b|سيارة|تاكسي)",
                               R"(\b(?:drives|driving|enters|gets in|inside|parks)\b|يقود|تقود|يركب|تركب|داخل)",
                               R"(\b(?:street|road|traffic|highway|parking)\b|شارع|طريق|زحام|مرور)"},
                              "Vehicle scene: book a car rig and traffic control",
                              "Hood mount two-shot through the windshield, tracking exterior plate"),
                    cinematic("emotional_isolation",
                              {R"(\b(?:alone|isolated|by (?:himself|herself))\b|وحيد|وحيدة|بمفرده|بمفردها)",
                               R"(\b(?:cries|tears|sobs|sad|anxious|grief)\b|تبكي|يبكي|دموع|حزين|حزينة|قلقة)",
                               R"(\b(?:silence|silent|quiet|window)\b|صمت|صامت|صامتة|نافذة|شباك)"},
                              "Emotional beat: let the silence play, no coverage cuts",
                              "Wide shot with negative space, then slow close-up"),
                    cinematic("rapid_search",
                              {R"(\b(?:searches|searching|rummages|looks for)\b|يبحث|تبحث|يفتش|تفتش)",
                               R"(\b(?:quickly|frantically|hurriedly|rushes)\b|بسرعة|مسرعا|مسرعة|بلهفة)",
                               R"(\b(?:drawers?|papers|shelves|bag)\b|أدراج|الدرج|أوراق|رفوف)"},
                              "Search beat: dress drawers and papers for repeated takes",
                              "Handheld coverage with quick inserts following the hands"),
                    cinematic("computer_action",
                              {R"(\b(?:laptop|computer|screen)s?\b|لابتوب|حاسب|كمبيوتر|شاشة)",
                               R"(\b(?:types|typing|clicks|scrolls|reads)\b|يكتب|تكتب|يقرأ|تقرأ|تتصفح)",
                               R"(\b(?:email|file|website|message)s?\b|بريد|ملف|موقع|رسالة)"},
                              "Screen work: prepare playback graphics for the monitor",
                              "Over-the-shoulder on the screen with a keyboard insert")};
        }

        static pattern_library build_pattern_library() {
            pattern_library lib{};
            add_scene_structure(lib);
            add_scene_type_vocabulary(lib);
            add_item_vocabulary(lib);
            add_effects_vocabulary(lib);
            add_synopsis_vocabulary(lib);
            add_cinematic_patterns(lib);
            return lib;
        }

    }  // namespace detail

    bool regex_found(const std::regex& re, std::string_view text) {
        return std::regex_search(text.data(), text.data() + text.size(), re);
    }

    bool term_pattern::search(std::string_view text) const {
        return regex_found(re, text);
    }

    std::size_t term_pattern::count(std::string_view text) const {
        std::cregex_iterator it{text.data(), text.data() + text.size(), re};
        return static_cast<std::size_t>(std::distance(it, std::cregex_iterator{}));
    }

    const pattern_library& default_patterns() {
        static const pattern_library lib = detail::build_pattern_library();
        return lib;
    }

}  // namespace callsheet
